#pragma once

#include <string>
#include <optional>
#include <cstdint>
#include <cstddef>

namespace symiosis {
namespace common {

enum class LogLevel {
    ERROR = 0,
    WARN = 1,
    INFO = 2,
    DEBUG = 3
};

struct GeneralConfig {
    double scroll_amount;
};

struct InterfaceConfig {
    std::string ui_theme;
    std::string font_family;
    uint16_t font_size;
    std::string editor_font_family;
    uint16_t editor_font_size;
    std::string markdown_render_theme;
    std::string md_render_code_theme;
    bool always_on_top;
    bool window_decorations;
    std::optional<std::string> custom_ui_theme_path;
    std::optional<std::string> custom_markdown_theme_path;
};

struct EditorConfig {
    std::string mode;
    std::string theme;
    bool word_wrap;
    uint16_t tab_size;
    bool expand_tabs;
    bool show_line_numbers;
};

struct ShortcutsConfig {
    std::string create_note;
    std::string rename_note;
    std::string delete_note;
    std::string edit_note;
    std::string save_and_exit;
    std::string open_external;
    std::string open_folder;
    std::string refresh_cache;
    std::string scroll_up;
    std::string scroll_down;
    std::string up;
    std::string down;
    std::string navigate_previous;
    std::string navigate_next;
    std::string navigate_code_previous;
    std::string navigate_code_next;
    std::string navigate_link_previous;
    std::string navigate_link_next;
    std::string copy_current_section;
    std::string open_settings;
    std::string version_explorer;
    std::string recently_deleted;
};

struct PreferencesConfig {
    size_t max_search_results;
};

struct AppConfig {
    std::string notes_directory;
    std::string global_shortcut;
    GeneralConfig general;
    InterfaceConfig interface;
    EditorConfig editor;
    ShortcutsConfig shortcuts;
    PreferencesConfig preferences;
};

bool operator==(const GeneralConfig& lhs, const GeneralConfig& rhs);
bool operator==(const InterfaceConfig& lhs, const InterfaceConfig& rhs);
bool operator==(const EditorConfig& lhs, const EditorConfig& rhs);
bool operator==(const ShortcutsConfig& lhs, const ShortcutsConfig& rhs);
bool operator==(const PreferencesConfig& lhs, const PreferencesConfig& rhs);
bool operator==(const AppConfig& lhs, const AppConfig& rhs);

inline bool operator!=(const AppConfig& lhs, const AppConfig& rhs) { return !(lhs == rhs); }

class Config {
public:
    static Config& instance();

    bool load(const std::string& config_file = "");

    const AppConfig& app() const { return app_; }

    std::string getConfigPath() const;
    std::optional<std::string> findBestConfig() const;

    static AppConfig createDefaultConfig();

private:
    Config();
    AppConfig app_;
    std::string current_config_path_;

    bool tryLoadTomlFile(const std::string& path);
};

}}
