#include "symiosis/config/json.hpp"
#include "symiosis/config/shortcut_fields.hpp"

namespace symiosis {
namespace config {

nlohmann::json JsonFormatter::format(const common::AppConfig& config) {
    nlohmann::json json;

    json["notes_directory"] = config.notes_directory;
    json["global_shortcut"] = config.global_shortcut;
    json["general"]["scroll_amount"] = config.general.scroll_amount;
    json["interface"] = formatInterface(config.interface);
    json["editor"] = formatEditor(config.editor);
    json["shortcuts"] = formatShortcuts(config.shortcuts);
    json["preferences"]["max_search_results"] = config.preferences.max_search_results;

    return json;
}

nlohmann::json JsonFormatter::formatInterface(const common::InterfaceConfig& ui) {
    nlohmann::json json;
    json["ui_theme"] = ui.ui_theme;
    json["font_family"] = ui.font_family;
    json["font_size"] = ui.font_size;
    json["editor_font_family"] = ui.editor_font_family;
    json["editor_font_size"] = ui.editor_font_size;
    json["markdown_render_theme"] = ui.markdown_render_theme;
    json["md_render_code_theme"] = ui.md_render_code_theme;
    json["always_on_top"] = ui.always_on_top;
    json["window_decorations"] = ui.window_decorations;

    if (ui.custom_ui_theme_path) {
        json["custom_ui_theme_path"] = *ui.custom_ui_theme_path;
    } else {
        json["custom_ui_theme_path"] = nullptr;
    }

    if (ui.custom_markdown_theme_path) {
        json["custom_markdown_theme_path"] = *ui.custom_markdown_theme_path;
    } else {
        json["custom_markdown_theme_path"] = nullptr;
    }

    return json;
}

nlohmann::json JsonFormatter::formatEditor(const common::EditorConfig& editor) {
    nlohmann::json json;
    json["mode"] = editor.mode;
    json["theme"] = editor.theme;
    json["word_wrap"] = editor.word_wrap;
    json["tab_size"] = editor.tab_size;
    json["expand_tabs"] = editor.expand_tabs;
    json["show_line_numbers"] = editor.show_line_numbers;
    return json;
}

nlohmann::json JsonFormatter::formatShortcuts(const common::ShortcutsConfig& shortcuts) {
    nlohmann::json json = nlohmann::json::object();
    for (const auto& field : shortcutFields()) {
        json[field.name] = shortcuts.*field.member;
    }
    return json;
}

}}
