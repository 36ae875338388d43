#include "symiosis/config/template.hpp"
#include "symiosis/config/catalogs.hpp"
#include "symiosis/config/shortcut_fields.hpp"
#include "symiosis/common/constants.hpp"
#include <spdlog/fmt/fmt.h>
#include <toml.hpp>
#include <sstream>
#include <vector>

namespace symiosis {
namespace config {

namespace {

std::string quote(const std::string& value) {
    std::string out = "\"";
    for (unsigned char c : value) {
        switch (c) {
            case '"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\t': out += "\\t"; break;
            case '\r': out += "\\r"; break;
            default:
                if (c < 0x20 || c == 0x7f) {
                    out += fmt::format("\\u{:04X}", static_cast<unsigned int>(c));
                } else {
                    out += static_cast<char>(c);
                }
        }
    }
    out += "\"";
    return out;
}

std::string join(const std::vector<std::string>& values) {
    std::string out;
    for (const auto& value : values) {
        if (!out.empty()) out += ", ";
        out += value;
    }
    return out;
}

const char* boolText(bool value) {
    return value ? "true" : "false";
}

}

std::string generateConfigTemplate() {
    return generateConfigTemplate(common::Config::createDefaultConfig());
}

std::string generateConfigTemplate(const common::AppConfig& config) {
    using namespace constants::limits;

    std::ostringstream out;

    out << "# " << constants::system::APPLICATION_NAME << " configuration\n";
    out << "# Invalid values are replaced by their defaults when the file is loaded.\n\n";

    out << "# Directory where notes are stored\n";
    out << "notes_directory = " << quote(config.notes_directory) << "\n\n";
    out << "# Global shortcut to show or hide the window (needs at least one modifier)\n";
    out << "global_shortcut = " << quote(config.global_shortcut) << "\n\n";

    out << "[general]\n";
    out << "scroll_amount = " << fmt::format("{}", config.general.scroll_amount) << "\n\n";

    const auto& ui = config.interface;
    out << "[interface]\n";
    out << "# Available: " << join(catalogs::ui_themes::getAvailable()) << "\n";
    out << "ui_theme = " << quote(ui.ui_theme) << "\n";
    out << "font_family = " << quote(ui.font_family) << "\n";
    out << fmt::format("# {}-{}\n", MIN_FONT_SIZE, MAX_FONT_SIZE);
    out << "font_size = " << ui.font_size << "\n";
    out << "editor_font_family = " << quote(ui.editor_font_family) << "\n";
    out << fmt::format("# {}-{}\n", MIN_FONT_SIZE, MAX_FONT_SIZE);
    out << "editor_font_size = " << ui.editor_font_size << "\n";
    out << "# Available: " << join(catalogs::markdown_themes::getAvailable()) << "\n";
    out << "markdown_render_theme = " << quote(ui.markdown_render_theme) << "\n";
    out << "# Available: " << join(catalogs::code_themes::getAvailable()) << "\n";
    out << "md_render_code_theme = " << quote(ui.md_render_code_theme) << "\n";
    out << "always_on_top = " << boolText(ui.always_on_top) << "\n";
    out << "window_decorations = " << boolText(ui.window_decorations) << "\n";
    if (ui.custom_ui_theme_path) {
        out << "custom_ui_theme_path = " << quote(*ui.custom_ui_theme_path) << "\n";
    } else {
        out << "# custom_ui_theme_path = \"/path/to/theme.css\"\n";
    }
    if (ui.custom_markdown_theme_path) {
        out << "custom_markdown_theme_path = " << quote(*ui.custom_markdown_theme_path) << "\n";
    } else {
        out << "# custom_markdown_theme_path = \"/path/to/markdown.css\"\n";
    }
    out << "\n";

    const auto& editor = config.editor;
    out << "[editor]\n";
    out << "# Available: " << join(catalogs::editor_modes::getAvailable()) << "\n";
    out << "mode = " << quote(editor.mode) << "\n";
    out << "# Available: " << join(catalogs::editor_themes::getAvailable()) << "\n";
    out << "theme = " << quote(editor.theme) << "\n";
    out << "word_wrap = " << boolText(editor.word_wrap) << "\n";
    out << fmt::format("# {}-{}\n", MIN_TAB_SIZE, MAX_TAB_SIZE);
    out << "tab_size = " << editor.tab_size << "\n";
    out << "expand_tabs = " << boolText(editor.expand_tabs) << "\n";
    out << "show_line_numbers = " << boolText(editor.show_line_numbers) << "\n\n";

    out << "[shortcuts]\n";
    for (const auto& field : shortcutFields()) {
        out << field.name << " = " << quote(config.shortcuts.*field.member) << "\n";
    }
    out << "\n";

    out << "[preferences]\n";
    out << fmt::format("# {}-{}\n", MIN_SEARCH_RESULTS, MAX_SEARCH_RESULTS);
    out << "max_search_results = " << config.preferences.max_search_results << "\n";

    return out.str();
}

std::string formatConfig(const common::AppConfig& config) {
    toml::table shortcuts;
    for (const auto& field : shortcutFields()) {
        shortcuts[field.name] = config.shortcuts.*field.member;
    }

    toml::table ui{
        {"ui_theme", config.interface.ui_theme},
        {"font_family", config.interface.font_family},
        {"font_size", config.interface.font_size},
        {"editor_font_family", config.interface.editor_font_family},
        {"editor_font_size", config.interface.editor_font_size},
        {"markdown_render_theme", config.interface.markdown_render_theme},
        {"md_render_code_theme", config.interface.md_render_code_theme},
        {"always_on_top", config.interface.always_on_top},
        {"window_decorations", config.interface.window_decorations}
    };
    if (config.interface.custom_ui_theme_path) {
        ui["custom_ui_theme_path"] = *config.interface.custom_ui_theme_path;
    }
    if (config.interface.custom_markdown_theme_path) {
        ui["custom_markdown_theme_path"] = *config.interface.custom_markdown_theme_path;
    }

    toml::value data = toml::table{
        {"notes_directory", config.notes_directory},
        {"global_shortcut", config.global_shortcut},
        {"general", toml::table{
            {"scroll_amount", config.general.scroll_amount}
        }},
        {"interface", ui},
        {"editor", toml::table{
            {"mode", config.editor.mode},
            {"theme", config.editor.theme},
            {"word_wrap", config.editor.word_wrap},
            {"tab_size", config.editor.tab_size},
            {"expand_tabs", config.editor.expand_tabs},
            {"show_line_numbers", config.editor.show_line_numbers}
        }},
        {"shortcuts", shortcuts},
        {"preferences", toml::table{
            {"max_search_results", config.preferences.max_search_results}
        }}
    };

    return toml::format(data);
}

}}
