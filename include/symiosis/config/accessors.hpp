#pragma once

#include "../common/app_state.hpp"
#include <string>

namespace symiosis {
namespace config {

// Raw text of the active config file, or the generated template when it cannot be read.
std::string getConfigContent();
std::string getConfigContent(const std::string& path);

bool configExists();
bool configExists(const common::AppState& state);

}}
