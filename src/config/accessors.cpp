#include "symiosis/config/accessors.hpp"
#include "symiosis/config/template.hpp"
#include "symiosis/common/config.hpp"
#include "symiosis/common/logger.hpp"
#include <filesystem>
#include <fstream>
#include <sstream>

namespace symiosis {
namespace config {

using common::Logger;

std::string getConfigContent() {
    return getConfigContent(common::Config::instance().getConfigPath());
}

std::string getConfigContent(const std::string& path) {
    try {
        std::error_code ec;
        if (!path.empty() && std::filesystem::is_regular_file(path, ec)) {
            std::ifstream file(path);
            if (file) {
                std::stringstream buffer;
                buffer << file.rdbuf();
                if (!file.bad()) {
                    return buffer.str();
                }
            }
            Logger::instance().warn("[Config] Config file not readable | path={}", path);
        } else {
            Logger::instance().debug("[Config] Config file missing, serving template | path={}", path);
        }
    } catch (const std::exception& e) {
        Logger::instance().warn("[Config] Config read failed | path={} | error={}", path, e.what());
    }

    return generateConfigTemplate();
}

bool configExists() {
    return configExists(common::AppState::instance());
}

bool configExists(const common::AppState& state) {
    return !state.wasFirstRun();
}

}}
