#pragma once

#include "../common/config.hpp"
#include <string>

namespace symiosis {
namespace config {

std::string generateConfigTemplate();
std::string generateConfigTemplate(const common::AppConfig& config);

// Serializes `config` as TOML without commentary.
std::string formatConfig(const common::AppConfig& config);

}}
