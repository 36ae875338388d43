#pragma once

#include "main_command.hpp"
#include <CLI/CLI.hpp>
#include <string>

namespace symiosis {
namespace cli {

class ConfigCommand : public MainCommand {
public:
    ConfigCommand();

    void setup(CLI::App* app);
    bool wasCalled() const;
    int execute();

private:
    bool was_called_;

    CLI::App* content_cmd_;
    CLI::App* exists_cmd_;

    CLI::App* show_cmd_;
    bool show_json_ = false;

    CLI::App* validate_cmd_;

    CLI::App* init_cmd_;
    bool init_force_ = false;

    CLI::App* path_cmd_;

    int executeContent();
    int executeExists();
    int executeShow();
    int executeValidate();
    int executeInit();
    int executePath();

    bool canWriteConfig(const std::string& config_path);
};

}}
