#include "main_command.hpp"
#include "symiosis/common/constants.hpp"
#include <iostream>

namespace symiosis {
namespace cli {

MainCommand::MainCommand() = default;
MainCommand::~MainCommand() = default;

void MainCommand::printHelp() const {
    std::cout << constants::system::APPLICATION_NAME << " - Configuration inspector\n\n";
    std::cout << "Usage: symiosis-config [OPTIONS] COMMAND\n\n";
    std::cout << "Options:\n";
    std::cout << "  -c, --config PATH    Configuration file path\n";
    std::cout << "  --log-level LEVEL    error, warn, info or debug\n";
    std::cout << "  -h, --help           Show this help message\n";
    std::cout << "  -v, --version        Show version information\n\n";
    std::cout << "Commands:\n";
    std::cout << "  content              Print the raw config file, or the default template\n";
    std::cout << "  exists               Report whether a config file was found\n";
    std::cout << "  show [--json]        Print the effective configuration\n";
    std::cout << "  validate             Check the config file without correcting it\n";
    std::cout << "  init [--force]       Write the default template to the config path\n";
    std::cout << "  path                 Print the resolved config path\n";
}

}}
