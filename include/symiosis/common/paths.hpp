#pragma once

#include <string>
#include <vector>

namespace symiosis {
namespace common {

class PathManager {
public:
    static PathManager& instance();

    std::string getConfigDir() const;
    std::string getConfigFile() const;
    std::vector<std::string> getConfigSearchPaths() const;

    std::string getHomeDir() const;
    std::string getDefaultNotesDir() const;

private:
    PathManager() = default;

    std::string getXdgConfigHome() const;
};

}}
