#include "symiosis/common/paths.hpp"
#include "symiosis/common/constants.hpp"
#include "symiosis/config/validator.hpp"
#include <unistd.h>
#include <pwd.h>
#include <cstdlib>
#include <cstring>

namespace symiosis {
namespace common {

PathManager& PathManager::instance() {
    static PathManager instance;
    return instance;
}

std::vector<std::string> PathManager::getConfigSearchPaths() const {
    std::vector<std::string> paths;

    if (const char* env = std::getenv(constants::system::CONFIG_ENV_OVERRIDE)) {
        if (strlen(env) > 0) {
            paths.push_back(env);
        }
    }

    paths.push_back(getConfigFile());

    return paths;
}

std::string PathManager::getConfigDir() const {
    std::string base = getXdgConfigHome();
    if (base.empty()) {
        return std::string("./") + constants::system::CONFIG_DIR_NAME;
    }
    return base + "/" + constants::system::CONFIG_DIR_NAME;
}

std::string PathManager::getConfigFile() const {
    return getConfigDir() + "/" + constants::system::CONFIG_FILE_NAME;
}

std::string PathManager::getHomeDir() const {
    const char* home = std::getenv("HOME");
    if (home && strlen(home) > 0) {
        return home;
    }

    struct passwd* pw = getpwuid(getuid());
    if (pw != nullptr && pw->pw_dir != nullptr) {
        return pw->pw_dir;
    }

    return "";
}

std::string PathManager::getDefaultNotesDir() const {
    std::string home = getHomeDir();
    if (home.empty()) {
        return constants::config_defaults::NOTES_FALLBACK_DIRECTORY;
    }
    if (home.back() == '/') {
        home.pop_back();
    }

    std::string notes_dir = home + "/" + constants::config_defaults::NOTES_SUBDIRECTORY;
    if (config::ConfigValidator::validateNotesDirectory(notes_dir)) {
        return constants::config_defaults::NOTES_FALLBACK_DIRECTORY;
    }
    return notes_dir;
}

std::string PathManager::getXdgConfigHome() const {
    const char* xdg = std::getenv("XDG_CONFIG_HOME");
    if (xdg && strlen(xdg) > 0) {
        return xdg;
    }
    std::string home = getHomeDir();
    return home.empty() ? "" : home + "/.config";
}

}}
