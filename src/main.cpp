#include <CLI/CLI.hpp>
#include <iostream>
#include <memory>
#include <string>

#include "symiosis/common/config.hpp"
#include "symiosis/common/constants.hpp"
#include "symiosis/common/logger.hpp"
#include "cli/config_command.hpp"

int main(int argc, char** argv) {
    try {
        CLI::App app{symiosis::constants::system::APPLICATION_NAME, "symiosis-config"};
        app.set_version_flag("--version,-v", symiosis::constants::version::getFullVersion());
        app.require_subcommand(0, 1);

        std::string config_file;
        std::string log_level = "warn";
        std::string log_file;

        app.add_option("-c,--config", config_file, "Configuration file path");
        app.add_option("--log-level", log_level, "Log level (error, warn, info, debug)")
            ->check([](const std::string& value) -> std::string {
                return symiosis::common::parseLogLevel(value) ? "" : "unknown log level: " + value;
            });
        app.add_option("--log-file", log_file, "Write logs to a rotating file instead of stderr");

        auto config_cmd = std::make_unique<symiosis::cli::ConfigCommand>();
        config_cmd->setup(&app);

        CLI11_PARSE(app, argc, argv);

        auto level = symiosis::common::parseLogLevel(log_level).value_or(symiosis::common::LogLevel::WARN);
        if (log_file.empty()) {
            symiosis::common::Logger::instance().initialize(
                symiosis::common::LogMode::CONSOLE_ONLY, "", level);
        } else {
            symiosis::common::Logger::instance().initialize(
                symiosis::common::LogMode::FILE_ONLY, log_file, level);
        }

        auto& config = symiosis::common::Config::instance();
        if (!config.load(config_file)) {
            std::cerr << "\033[31mError: Failed to load configuration\033[0m\n";
            return 1;
        }

        int result = 0;
        if (config_cmd->wasCalled()) {
            result = config_cmd->execute();
        } else {
            config_cmd->printHelp();
        }

        symiosis::common::Logger::instance().shutdown();
        return result;

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
