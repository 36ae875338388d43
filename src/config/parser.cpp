#include "symiosis/config/parser.hpp"
#include "symiosis/config/shortcut_fields.hpp"
#include "symiosis/common/constants.hpp"
#include <toml.hpp>
#include <cmath>
#include <cstdint>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace symiosis {
namespace config {

namespace {

const toml::value* findSection(const toml::value& data, const char* name) {
    if (!data.contains(name)) {
        return nullptr;
    }
    const auto& section = data.at(name);
    if (!section.is_table()) {
        throw std::runtime_error(fmt::format("'{}' must be a table", name));
    }
    return &section;
}

void readString(const toml::value& table, const char* key, std::string& out) {
    if (table.contains(key)) {
        out = toml::find<std::string>(table, key);
    }
}

void readOptionalString(const toml::value& table, const char* key, std::optional<std::string>& out) {
    if (table.contains(key)) {
        out = toml::find<std::string>(table, key);
    }
}

void readBool(const toml::value& table, const char* key, bool& out) {
    if (table.contains(key)) {
        out = toml::find<bool>(table, key);
    }
}

void readDouble(const toml::value& table, const char* key, double& out) {
    if (!table.contains(key)) {
        return;
    }
    const auto& value = table.at(key);
    double decoded = value.is_integer() ? static_cast<double>(toml::get<std::int64_t>(value))
                                        : toml::get<double>(value);
    if (!std::isfinite(decoded)) {
        throw std::out_of_range(fmt::format("'{}' must be a finite number", key));
    }
    out = decoded;
}

template<typename T>
void readUnsigned(const toml::value& table, const char* key, T& out) {
    if (!table.contains(key)) {
        return;
    }
    auto raw = toml::find<std::int64_t>(table, key);
    if (raw < 0 || static_cast<uint64_t>(raw) > std::numeric_limits<T>::max()) {
        throw std::out_of_range(fmt::format(
            "'{}' = {} does not fit an unsigned {}-bit field", key, raw, sizeof(T) * 8));
    }
    out = static_cast<T>(raw);
}

}

ConfigParser::ConfigParser(common::EventSink sink) : sink_(std::move(sink)) {}

common::AppConfig ConfigParser::parse(const std::string& content) const {
    const auto defaults = common::Config::createDefaultConfig();

    try {
        return decode(content, defaults);
    } catch (const std::exception& e) {
        if (sink_) {
            sink_(constants::log_categories::CONFIG_PARSE,
                  "Failed to parse config TOML. Using defaults.",
                  std::string(e.what()));
        }
        return defaults;
    }
}

common::AppConfig ConfigParser::decode(const std::string& content, const common::AppConfig& base) {
    std::istringstream stream(content);
    const auto data = toml::parse(stream, constants::system::CONFIG_FILE_NAME);

    common::AppConfig config = base;

    readString(data, "notes_directory", config.notes_directory);
    readString(data, "global_shortcut", config.global_shortcut);

    if (const auto* general = findSection(data, "general")) {
        readDouble(*general, "scroll_amount", config.general.scroll_amount);
    }

    if (const auto* ui = findSection(data, "interface")) {
        auto& target = config.interface;
        readString(*ui, "ui_theme", target.ui_theme);
        readString(*ui, "font_family", target.font_family);
        readUnsigned(*ui, "font_size", target.font_size);
        readString(*ui, "editor_font_family", target.editor_font_family);
        readUnsigned(*ui, "editor_font_size", target.editor_font_size);
        readString(*ui, "markdown_render_theme", target.markdown_render_theme);
        readString(*ui, "md_render_code_theme", target.md_render_code_theme);
        readBool(*ui, "always_on_top", target.always_on_top);
        readBool(*ui, "window_decorations", target.window_decorations);
        readOptionalString(*ui, "custom_ui_theme_path", target.custom_ui_theme_path);
        readOptionalString(*ui, "custom_markdown_theme_path", target.custom_markdown_theme_path);
    }

    if (const auto* editor = findSection(data, "editor")) {
        auto& target = config.editor;
        readString(*editor, "mode", target.mode);
        readString(*editor, "theme", target.theme);
        readBool(*editor, "word_wrap", target.word_wrap);
        readUnsigned(*editor, "tab_size", target.tab_size);
        readBool(*editor, "expand_tabs", target.expand_tabs);
        readBool(*editor, "show_line_numbers", target.show_line_numbers);
    }

    if (const auto* shortcuts = findSection(data, "shortcuts")) {
        for (const auto& field : shortcutFields()) {
            readString(*shortcuts, field.name, config.shortcuts.*field.member);
        }
    }

    if (const auto* preferences = findSection(data, "preferences")) {
        readUnsigned(*preferences, "max_search_results", config.preferences.max_search_results);
    }

    return config;
}

}}
