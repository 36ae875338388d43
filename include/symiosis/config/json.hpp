#pragma once

#include "../common/config.hpp"
#include <nlohmann/json.hpp>

namespace symiosis {
namespace config {

class JsonFormatter {
public:
    static nlohmann::json format(const common::AppConfig& config);

private:
    static nlohmann::json formatInterface(const common::InterfaceConfig& ui);
    static nlohmann::json formatEditor(const common::EditorConfig& editor);
    static nlohmann::json formatShortcuts(const common::ShortcutsConfig& shortcuts);
};

}}
