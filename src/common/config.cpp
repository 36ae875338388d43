#include "symiosis/common/config.hpp"
#include "symiosis/common/app_state.hpp"
#include "symiosis/common/constants.hpp"
#include "symiosis/common/paths.hpp"
#include "symiosis/common/logger.hpp"
#include "symiosis/config/catalogs.hpp"
#include "symiosis/config/sanitizer.hpp"
#include <cmath>
#include <fstream>
#include <sstream>
#include <filesystem>
#include <tuple>
#include <unistd.h>

namespace symiosis {
namespace common {

bool operator==(const GeneralConfig& lhs, const GeneralConfig& rhs) {
    if (std::isnan(lhs.scroll_amount) || std::isnan(rhs.scroll_amount)) {
        return std::isnan(lhs.scroll_amount) && std::isnan(rhs.scroll_amount);
    }
    return lhs.scroll_amount == rhs.scroll_amount;
}

bool operator==(const InterfaceConfig& lhs, const InterfaceConfig& rhs) {
    return std::tie(lhs.ui_theme, lhs.font_family, lhs.font_size, lhs.editor_font_family,
                    lhs.editor_font_size, lhs.markdown_render_theme, lhs.md_render_code_theme,
                    lhs.always_on_top, lhs.window_decorations, lhs.custom_ui_theme_path,
                    lhs.custom_markdown_theme_path) ==
           std::tie(rhs.ui_theme, rhs.font_family, rhs.font_size, rhs.editor_font_family,
                    rhs.editor_font_size, rhs.markdown_render_theme, rhs.md_render_code_theme,
                    rhs.always_on_top, rhs.window_decorations, rhs.custom_ui_theme_path,
                    rhs.custom_markdown_theme_path);
}

bool operator==(const EditorConfig& lhs, const EditorConfig& rhs) {
    return std::tie(lhs.mode, lhs.theme, lhs.word_wrap, lhs.tab_size,
                    lhs.expand_tabs, lhs.show_line_numbers) ==
           std::tie(rhs.mode, rhs.theme, rhs.word_wrap, rhs.tab_size,
                    rhs.expand_tabs, rhs.show_line_numbers);
}

bool operator==(const ShortcutsConfig& lhs, const ShortcutsConfig& rhs) {
    return std::tie(lhs.create_note, lhs.rename_note, lhs.delete_note, lhs.edit_note,
                    lhs.save_and_exit, lhs.open_external, lhs.open_folder, lhs.refresh_cache,
                    lhs.scroll_up, lhs.scroll_down, lhs.up, lhs.down,
                    lhs.navigate_previous, lhs.navigate_next,
                    lhs.navigate_code_previous, lhs.navigate_code_next,
                    lhs.navigate_link_previous, lhs.navigate_link_next,
                    lhs.copy_current_section, lhs.open_settings,
                    lhs.version_explorer, lhs.recently_deleted) ==
           std::tie(rhs.create_note, rhs.rename_note, rhs.delete_note, rhs.edit_note,
                    rhs.save_and_exit, rhs.open_external, rhs.open_folder, rhs.refresh_cache,
                    rhs.scroll_up, rhs.scroll_down, rhs.up, rhs.down,
                    rhs.navigate_previous, rhs.navigate_next,
                    rhs.navigate_code_previous, rhs.navigate_code_next,
                    rhs.navigate_link_previous, rhs.navigate_link_next,
                    rhs.copy_current_section, rhs.open_settings,
                    rhs.version_explorer, rhs.recently_deleted);
}

bool operator==(const PreferencesConfig& lhs, const PreferencesConfig& rhs) {
    return lhs.max_search_results == rhs.max_search_results;
}

bool operator==(const AppConfig& lhs, const AppConfig& rhs) {
    return lhs.notes_directory == rhs.notes_directory &&
           lhs.global_shortcut == rhs.global_shortcut &&
           lhs.general == rhs.general &&
           lhs.interface == rhs.interface &&
           lhs.editor == rhs.editor &&
           lhs.shortcuts == rhs.shortcuts &&
           lhs.preferences == rhs.preferences;
}

Config& Config::instance() {
    static Config instance;
    return instance;
}

Config::Config() {
    app_ = createDefaultConfig();
}

AppConfig Config::createDefaultConfig() {
    using namespace constants::config_defaults;
    namespace keys = constants::shortcut_defaults;

    AppConfig config;

    config.notes_directory = PathManager::instance().getDefaultNotesDir();
    config.global_shortcut = GLOBAL_SHORTCUT;

    config.general.scroll_amount = SCROLL_AMOUNT;

    config.interface.ui_theme = catalogs::ui_themes::DEFAULT;
    config.interface.font_family = FONT_FAMILY;
    config.interface.font_size = FONT_SIZE;
    config.interface.editor_font_family = EDITOR_FONT_FAMILY;
    config.interface.editor_font_size = EDITOR_FONT_SIZE;
    config.interface.markdown_render_theme = catalogs::markdown_themes::DEFAULT;
    config.interface.md_render_code_theme = catalogs::code_themes::DEFAULT;
    config.interface.always_on_top = ALWAYS_ON_TOP;
    config.interface.window_decorations = WINDOW_DECORATIONS;
    config.interface.custom_ui_theme_path = std::nullopt;
    config.interface.custom_markdown_theme_path = std::nullopt;

    config.editor.mode = catalogs::editor_modes::DEFAULT;
    config.editor.theme = catalogs::editor_themes::DEFAULT;
    config.editor.word_wrap = WORD_WRAP;
    config.editor.tab_size = TAB_SIZE;
    config.editor.expand_tabs = EXPAND_TABS;
    config.editor.show_line_numbers = SHOW_LINE_NUMBERS;

    config.shortcuts.create_note = keys::CREATE_NOTE;
    config.shortcuts.rename_note = keys::RENAME_NOTE;
    config.shortcuts.delete_note = keys::DELETE_NOTE;
    config.shortcuts.edit_note = keys::EDIT_NOTE;
    config.shortcuts.save_and_exit = keys::SAVE_AND_EXIT;
    config.shortcuts.open_external = keys::OPEN_EXTERNAL;
    config.shortcuts.open_folder = keys::OPEN_FOLDER;
    config.shortcuts.refresh_cache = keys::REFRESH_CACHE;
    config.shortcuts.scroll_up = keys::SCROLL_UP;
    config.shortcuts.scroll_down = keys::SCROLL_DOWN;
    config.shortcuts.up = keys::UP;
    config.shortcuts.down = keys::DOWN;
    config.shortcuts.navigate_previous = keys::NAVIGATE_PREVIOUS;
    config.shortcuts.navigate_next = keys::NAVIGATE_NEXT;
    config.shortcuts.navigate_code_previous = keys::NAVIGATE_CODE_PREVIOUS;
    config.shortcuts.navigate_code_next = keys::NAVIGATE_CODE_NEXT;
    config.shortcuts.navigate_link_previous = keys::NAVIGATE_LINK_PREVIOUS;
    config.shortcuts.navigate_link_next = keys::NAVIGATE_LINK_NEXT;
    config.shortcuts.copy_current_section = keys::COPY_CURRENT_SECTION;
    config.shortcuts.open_settings = keys::OPEN_SETTINGS;
    config.shortcuts.version_explorer = keys::VERSION_EXPLORER;
    config.shortcuts.recently_deleted = keys::RECENTLY_DELETED;

    config.preferences.max_search_results = MAX_SEARCH_RESULTS;

    return config;
}

std::optional<std::string> Config::findBestConfig() const {
    auto paths = PathManager::instance().getConfigSearchPaths();

    for (const auto& path : paths) {
        if (std::filesystem::exists(path) && access(path.c_str(), R_OK) == 0) {
            return path;
        }
    }

    return std::nullopt;
}

bool Config::load(const std::string& config_file) {
    try {
        app_ = createDefaultConfig();

        std::string effective_config_file = config_file;
        if (effective_config_file.empty()) {
            auto best = findBestConfig();
            effective_config_file = best ? *best : PathManager::instance().getConfigFile();
        }

        current_config_path_ = effective_config_file;

        bool found = tryLoadTomlFile(effective_config_file);
        AppState::instance().setWasFirstRun(!found);

        Logger::instance().info("[Config] Loaded | path={} | first_run={}",
                               effective_config_file, !found);
        return true;
    } catch (const std::exception& e) {
        Logger::instance().error("[Config] Load failed | error={}", e.what());
        app_ = createDefaultConfig();
        return false;
    }
}

bool Config::tryLoadTomlFile(const std::string& path) {
    if (!std::filesystem::exists(path)) {
        Logger::instance().debug("[Config] Config file not found | path={}", path);
        return false;
    }

    if (access(path.c_str(), R_OK) != 0) {
        Logger::instance().warn("[Config] Config file not readable | path={}", path);
        return false;
    }

    std::ifstream file(path);
    if (!file) {
        Logger::instance().warn("[Config] Config file open failed | path={}", path);
        return false;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    app_ = config::loadConfigFromContent(buffer.str());

    Logger::instance().debug("[Config] Config file read | path={} | bytes={}", path, buffer.str().size());
    return true;
}

std::string Config::getConfigPath() const {
    if (!current_config_path_.empty()) {
        return current_config_path_;
    }
    auto best = findBestConfig();
    return best ? *best : PathManager::instance().getConfigFile();
}

}}
