#pragma once

#include "../common/config.hpp"
#include <array>
#include <string>

namespace symiosis {
namespace config {

struct ShortcutField {
    const char* name;
    std::string common::ShortcutsConfig::* member;
};

// Every per-action shortcut, in the order they appear in the config file.
inline const std::array<ShortcutField, 22>& shortcutFields() {
    using S = common::ShortcutsConfig;
    static const std::array<ShortcutField, 22> fields = {{
        {"create_note", &S::create_note},
        {"rename_note", &S::rename_note},
        {"delete_note", &S::delete_note},
        {"edit_note", &S::edit_note},
        {"save_and_exit", &S::save_and_exit},
        {"open_external", &S::open_external},
        {"open_folder", &S::open_folder},
        {"refresh_cache", &S::refresh_cache},
        {"scroll_up", &S::scroll_up},
        {"scroll_down", &S::scroll_down},
        {"up", &S::up},
        {"down", &S::down},
        {"navigate_previous", &S::navigate_previous},
        {"navigate_next", &S::navigate_next},
        {"navigate_code_previous", &S::navigate_code_previous},
        {"navigate_code_next", &S::navigate_code_next},
        {"navigate_link_previous", &S::navigate_link_previous},
        {"navigate_link_next", &S::navigate_link_next},
        {"copy_current_section", &S::copy_current_section},
        {"open_settings", &S::open_settings},
        {"version_explorer", &S::version_explorer},
        {"recently_deleted", &S::recently_deleted}
    }};
    return fields;
}

}}
