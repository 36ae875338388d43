#include "symiosis/config/sanitizer.hpp"
#include "symiosis/config/catalogs.hpp"
#include "symiosis/config/parser.hpp"
#include "symiosis/config/shortcut_fields.hpp"
#include "symiosis/config/validator.hpp"
#include "symiosis/common/constants.hpp"

namespace symiosis {
namespace config {

using common::Logger;

ConfigSanitizer::ConfigSanitizer(common::EventSink sink) : sink_(std::move(sink)) {}

template<typename Check>
bool ConfigSanitizer::correctString(const std::string& field, std::string& value, const std::string& fallback,
                                    Check check) const {
    auto error = check(value);
    if (!error) {
        return false;
    }

    emit(fmt::format("Invalid {} {}. Using default {}.", field,
                     ConfigMasker::forLog(value), ConfigMasker::forLog(fallback)),
         error->message);
    value = fallback;
    return true;
}

bool ConfigSanitizer::correctChoice(const std::string& field, std::string& value, const std::string& fallback,
                                    bool supported) const {
    if (supported) {
        return false;
    }

    emit(fmt::format("Invalid {} {}. Using default {}.", field,
                     ConfigMasker::forLog(value), ConfigMasker::forLog(fallback)),
         std::string(ValidationErrorCodeHelper::getMessage(ValidationErrorCode::VALUE_NOT_IN_CATALOG)));
    value = fallback;
    return true;
}

template<typename T>
bool ConfigSanitizer::correctNumber(const std::string& field, T& value, T fallback,
                                    const std::optional<ValidationError>& error) const {
    if (!error) {
        return false;
    }

    emit(fmt::format("Invalid {} {}. Using default {}.", field, value, fallback), error->message);
    value = fallback;
    return true;
}

void ConfigSanitizer::emit(const std::string& message, const std::optional<std::string>& detail) const {
    if (sink_) {
        sink_(constants::log_categories::CONFIG_VALIDATION, message, detail);
    }
}

size_t ConfigSanitizer::sanitize(common::AppConfig& config, const common::AppConfig& defaults) const {
    size_t corrected = 0;

    if (correctString("notes_directory", config.notes_directory, defaults.notes_directory,
                      &ConfigValidator::validateNotesDirectory)) {
        ++corrected;
    }

    if (correctString("global_shortcut", config.global_shortcut, defaults.global_shortcut,
                      &ConfigValidator::validateShortcutFormat)) {
        ++corrected;
    }

    corrected += sanitizeInterface(config.interface, defaults.interface);
    corrected += sanitizeEditor(config.editor, defaults.editor);
    corrected += sanitizeShortcuts(config.shortcuts, defaults.shortcuts);
    corrected += sanitizePreferences(config.preferences, defaults.preferences);

    if (corrected > 0) {
        Logger::instance().info("[Sanitizer] Completed | corrected={}", corrected);
    } else {
        Logger::instance().debug("[Sanitizer] Completed | corrected=0");
    }

    return corrected;
}

size_t ConfigSanitizer::sanitizeInterface(common::InterfaceConfig& config,
                                          const common::InterfaceConfig& defaults) const {
    size_t corrected = 0;

    corrected += correctChoice("interface.ui_theme", config.ui_theme, defaults.ui_theme,
                               catalogs::ui_themes::isSupported(config.ui_theme));
    corrected += correctChoice("interface.markdown_render_theme", config.markdown_render_theme,
                               defaults.markdown_render_theme,
                               catalogs::markdown_themes::isSupported(config.markdown_render_theme));
    corrected += correctChoice("interface.md_render_code_theme", config.md_render_code_theme,
                               defaults.md_render_code_theme,
                               catalogs::code_themes::isSupported(config.md_render_code_theme));

    corrected += correctNumber("interface.font_size", config.font_size, defaults.font_size,
                               ConfigValidator::validateFontSize(config.font_size, "UI font size"));
    corrected += correctNumber("interface.editor_font_size", config.editor_font_size, defaults.editor_font_size,
                               ConfigValidator::validateFontSize(config.editor_font_size, "Editor font size"));

    return corrected;
}

size_t ConfigSanitizer::sanitizeEditor(common::EditorConfig& config, const common::EditorConfig& defaults) const {
    size_t corrected = 0;

    corrected += correctChoice("editor.mode", config.mode, defaults.mode,
                               catalogs::editor_modes::isSupported(config.mode));
    corrected += correctChoice("editor.theme", config.theme, defaults.theme,
                               catalogs::editor_themes::isSupported(config.theme));
    corrected += correctNumber("editor.tab_size", config.tab_size, defaults.tab_size,
                               ConfigValidator::validateRange(config.tab_size,
                                                              constants::limits::MIN_TAB_SIZE,
                                                              constants::limits::MAX_TAB_SIZE,
                                                              "Tab size"));

    return corrected;
}

size_t ConfigSanitizer::sanitizeShortcuts(common::ShortcutsConfig& config,
                                          const common::ShortcutsConfig& defaults) const {
    size_t corrected = 0;

    for (const auto& field : shortcutFields()) {
        corrected += correctString(std::string("shortcuts.") + field.name,
                                   config.*field.member, defaults.*field.member,
                                   &ConfigValidator::validateBasicShortcutFormat);
    }

    return corrected;
}

size_t ConfigSanitizer::sanitizePreferences(common::PreferencesConfig& config,
                                            const common::PreferencesConfig& defaults) const {
    return correctNumber("preferences.max_search_results", config.max_search_results,
                         defaults.max_search_results,
                         ConfigValidator::validateRange(config.max_search_results,
                                                        constants::limits::MIN_SEARCH_RESULTS,
                                                        constants::limits::MAX_SEARCH_RESULTS,
                                                        "Max search results"));
}

common::AppConfig loadConfigFromContent(const std::string& content, const common::EventSink& sink) {
    ConfigParser parser(sink);
    common::AppConfig config = parser.parse(content);

    ConfigSanitizer sanitizer(sink);
    sanitizer.sanitize(config, common::Config::createDefaultConfig());

    return config;
}

}}
