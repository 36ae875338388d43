#include "config_command.hpp"
#include "symiosis/common/config.hpp"
#include "symiosis/common/logger.hpp"
#include "symiosis/config/accessors.hpp"
#include "symiosis/config/json.hpp"
#include "symiosis/config/parser.hpp"
#include "symiosis/config/template.hpp"
#include "symiosis/config/validator.hpp"
#include <iostream>
#include <fstream>
#include <sstream>
#include <filesystem>
#include <unistd.h>

namespace symiosis {
namespace cli {

ConfigCommand::ConfigCommand() : was_called_(false) {}

void ConfigCommand::setup(CLI::App* app) {
    app_ = app;

    content_cmd_ = app->add_subcommand("content", "Print the raw config file, or the default template");
    content_cmd_->callback([this]() { was_called_ = true; });

    exists_cmd_ = app->add_subcommand("exists", "Report whether a config file was found");
    exists_cmd_->callback([this]() { was_called_ = true; });

    show_cmd_ = app->add_subcommand("show", "Print the effective configuration");
    show_cmd_->add_flag("--json", show_json_, "Print as JSON");
    show_cmd_->callback([this]() { was_called_ = true; });

    validate_cmd_ = app->add_subcommand("validate", "Check the config file without correcting it");
    validate_cmd_->callback([this]() { was_called_ = true; });

    init_cmd_ = app->add_subcommand("init", "Write the default template to the config path");
    init_cmd_->add_flag("-f,--force", init_force_, "Overwrite an existing file");
    init_cmd_->callback([this]() { was_called_ = true; });

    path_cmd_ = app->add_subcommand("path", "Print the resolved config path");
    path_cmd_->callback([this]() { was_called_ = true; });
}

bool ConfigCommand::wasCalled() const {
    return was_called_;
}

int ConfigCommand::execute() {
    if (content_cmd_->parsed()) {
        return executeContent();
    } else if (exists_cmd_->parsed()) {
        return executeExists();
    } else if (show_cmd_->parsed()) {
        return executeShow();
    } else if (validate_cmd_->parsed()) {
        return executeValidate();
    } else if (init_cmd_->parsed()) {
        return executeInit();
    } else if (path_cmd_->parsed()) {
        return executePath();
    }

    std::cout << app_->help() << std::endl;
    return 0;
}

int ConfigCommand::executeContent() {
    std::cout << config::getConfigContent();
    return 0;
}

int ConfigCommand::executeExists() {
    bool exists = config::configExists();
    std::cout << (exists ? "true" : "false") << "\n";
    return exists ? 0 : 1;
}

int ConfigCommand::executeShow() {
    const auto& app = common::Config::instance().app();

    if (show_json_) {
        std::cout << config::JsonFormatter::format(app).dump(2) << "\n";
    } else {
        std::cout << config::formatConfig(app);
    }
    return 0;
}

int ConfigCommand::executeValidate() {
    auto& config = common::Config::instance();
    std::string config_path = config.getConfigPath();

    std::cout << "Validating: " << config_path << "\n\n";

    if (!std::filesystem::exists(config_path)) {
        std::cout << "No configuration file found. Defaults are in use.\n";
        return 0;
    }

    std::ifstream file(config_path);
    if (!file) {
        std::cerr << "\033[31mError: Failed to read configuration file\033[0m\n";
        return 1;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    common::AppConfig raw;
    try {
        raw = config::ConfigParser::decode(buffer.str(), common::Config::createDefaultConfig());
        std::cout << "Syntax: Valid\n";
    } catch (const std::exception& e) {
        std::cout << "Syntax: Invalid\n";
        std::cout << "  ERROR: " << e.what() << "\n";
        std::cout << "\nConfiguration has errors. Defaults will be used for every field.\n";
        return 1;
    }

    config::ConfigValidator validator;
    auto result = validator.validate(raw);

    for (const auto& error : result.errors) {
        std::cout << "  ERROR: " << error << "\n";
    }

    std::cout << "\nErrors: " << result.errors.size() << "\n";

    if (result.is_valid) {
        std::cout << "\nConfiguration is valid.\n";
        return 0;
    }

    std::cout << "\nConfiguration has errors. Invalid fields will fall back to defaults.\n";
    return 1;
}

int ConfigCommand::executeInit() {
    std::string config_path = common::Config::instance().getConfigPath();

    if (std::filesystem::exists(config_path) && !init_force_) {
        std::cerr << "\033[31mError: Configuration file already exists\033[0m\n\n";
        std::cerr << "File: " << config_path << "\n";
        std::cerr << "Use --force to overwrite.\n";
        return 1;
    }

    std::error_code ec;
    std::filesystem::path config_dir = std::filesystem::path(config_path).parent_path();
    if (!config_dir.empty()) {
        std::filesystem::create_directories(config_dir, ec);
        if (ec) {
            std::cerr << "\033[31mError: Cannot create configuration directory\033[0m\n\n";
            std::cerr << "Directory: " << config_dir.string() << "\n";
            std::cerr << ec.message() << "\n";
            return 1;
        }
    }

    if (!canWriteConfig(config_path)) {
        std::cerr << "\033[31mError: Permission denied\033[0m\n\n";
        std::cerr << "Resource: " << config_path << "\n";
        return 1;
    }

    std::ofstream file(config_path, std::ios::trunc);
    if (!file) {
        std::cerr << "\033[31mError: Failed to open configuration file for writing\033[0m\n";
        return 1;
    }

    file << config::generateConfigTemplate();
    file.close();
    if (!file) {
        std::cerr << "\033[31mError: Failed to write configuration file\033[0m\n";
        return 1;
    }

    common::Logger::instance().info("[Config] Template written | path={}", config_path);
    std::cout << "✓ Configuration written: " << config_path << "\n";
    return 0;
}

int ConfigCommand::executePath() {
    std::cout << common::Config::instance().getConfigPath() << "\n";
    return 0;
}

bool ConfigCommand::canWriteConfig(const std::string& config_path) {
    if (std::filesystem::exists(config_path)) {
        return access(config_path.c_str(), W_OK) == 0;
    }

    std::filesystem::path parent = std::filesystem::path(config_path).parent_path();
    if (parent.empty()) {
        parent = ".";
    }
    return access(parent.c_str(), W_OK) == 0;
}

}}
