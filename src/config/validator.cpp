#include "symiosis/config/validator.hpp"
#include "symiosis/config/catalogs.hpp"
#include "symiosis/config/shortcut_fields.hpp"
#include "symiosis/common/constants.hpp"
#include "symiosis/common/logger.hpp"
#include <algorithm>
#include <cctype>
#include <set>

namespace symiosis {
namespace config {

namespace {

struct ParsedShortcut {
    std::vector<std::string> modifiers;
    std::string key;
};

std::string toLower(const std::string& value) {
    std::string lower = value;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower;
}

ValidationError makeError(ValidationErrorCode code, const std::string& message) {
    return ValidationError{code, message};
}

ValidationError makeError(ValidationErrorCode code) {
    return ValidationError{code, ValidationErrorCodeHelper::getMessage(code)};
}

std::string canonicalModifier(const std::string& token) {
    std::string lower = toLower(token);
    if (lower == "ctrl" || lower == "control") return "ctrl";
    if (lower == "alt" || lower == "option") return "alt";
    if (lower == "shift") return "shift";
    if (lower == "meta" || lower == "cmd" || lower == "command" || lower == "super") return "meta";
    if (lower == "cmdorctrl" || lower == "cmdorcontrol" ||
        lower == "commandorctrl" || lower == "commandorcontrol") return "cmdorctrl";
    return "";
}

bool hasWhitespaceOrControl(const std::string& token) {
    return std::any_of(token.begin(), token.end(), [](unsigned char c) {
        return std::isspace(c) || c < 0x20 || c == 0x7f;
    });
}

std::optional<ValidationError> tokenize(const std::string& shortcut, ParsedShortcut& parsed) {
    if (shortcut.empty()) {
        return makeError(ValidationErrorCode::SHORTCUT_EMPTY);
    }

    if (shortcut.size() > constants::limits::MAX_SHORTCUT_LENGTH) {
        return makeError(ValidationErrorCode::SHORTCUT_TOO_LONG,
            fmt::format("Shortcut too long (max {} characters)", constants::limits::MAX_SHORTCUT_LENGTH));
    }

    std::string prefix;
    if (shortcut.back() == '+') {
        if (shortcut.size() == 1) {
            parsed.key = "+";
        } else if (shortcut[shortcut.size() - 2] == '+') {
            parsed.key = "+";
            prefix = shortcut.substr(0, shortcut.size() - 2);
            if (prefix.empty()) {
                return makeError(ValidationErrorCode::SHORTCUT_MALFORMED,
                                 "Shortcut has an empty segment");
            }
        } else {
            return makeError(ValidationErrorCode::SHORTCUT_MALFORMED,
                             "Shortcut ends with a separator");
        }
    } else {
        auto pos = shortcut.rfind('+');
        if (pos == std::string::npos) {
            parsed.key = shortcut;
        } else {
            parsed.key = shortcut.substr(pos + 1);
            prefix = shortcut.substr(0, pos);
            if (prefix.empty()) {
                return makeError(ValidationErrorCode::SHORTCUT_MALFORMED,
                                 "Shortcut starts with a separator");
            }
        }
    }

    if (!prefix.empty()) {
        size_t start = 0;
        while (true) {
            size_t end = prefix.find('+', start);
            std::string token = prefix.substr(start, end == std::string::npos ? std::string::npos : end - start);
            if (token.empty()) {
                return makeError(ValidationErrorCode::SHORTCUT_MALFORMED,
                                 "Shortcut has an empty segment");
            }
            parsed.modifiers.push_back(token);
            if (end == std::string::npos) break;
            start = end + 1;
        }
    }

    for (const auto& modifier : parsed.modifiers) {
        if (hasWhitespaceOrControl(modifier)) {
            return makeError(ValidationErrorCode::SHORTCUT_MALFORMED,
                             "Shortcut segments cannot contain whitespace");
        }
        if (!ConfigValidator::isModifier(modifier)) {
            return makeError(ValidationErrorCode::SHORTCUT_UNKNOWN_MODIFIER,
                             fmt::format("Unknown modifier '{}'", modifier));
        }
    }

    if (hasWhitespaceOrControl(parsed.key)) {
        return makeError(ValidationErrorCode::SHORTCUT_INVALID_KEY,
                         "Shortcut key cannot contain whitespace");
    }

    if (ConfigValidator::isModifier(parsed.key)) {
        return makeError(ValidationErrorCode::SHORTCUT_MALFORMED,
                         "Shortcut must end with a non-modifier key");
    }

    return std::nullopt;
}

bool isFunctionKey(const std::string& lower) {
    if (lower.size() < 2 || lower.size() > 3 || lower[0] != 'f') return false;
    if (!std::all_of(lower.begin() + 1, lower.end(),
                     [](unsigned char c) { return std::isdigit(c); })) {
        return false;
    }
    int number = std::stoi(lower.substr(1));
    return number >= 1 && number <= 24;
}

bool isRecognizedKey(const std::string& key) {
    static const std::set<std::string> NAMED_KEYS = {
        "space", "enter", "return", "tab", "escape", "esc", "backspace",
        "delete", "del", "insert", "home", "end", "pageup", "pagedown",
        "up", "down", "left", "right",
        "arrowup", "arrowdown", "arrowleft", "arrowright"
    };

    if (key.size() == 1) {
        unsigned char c = static_cast<unsigned char>(key[0]);
        return std::isalnum(c) || std::ispunct(c);
    }

    std::string lower = toLower(key);
    if (NAMED_KEYS.count(lower) > 0 || isFunctionKey(lower)) {
        return true;
    }

    if (lower.size() == 4 && lower.compare(0, 3, "key") == 0) {
        return std::isalpha(static_cast<unsigned char>(lower[3])) != 0;
    }
    if (lower.size() == 6 && lower.compare(0, 5, "digit") == 0) {
        return std::isdigit(static_cast<unsigned char>(lower[5])) != 0;
    }

    return false;
}

bool hasParentComponent(const std::string& path) {
    size_t start = 0;
    while (start <= path.size()) {
        size_t end = path.find('/', start);
        if (end == std::string::npos) end = path.size();
        if (path.compare(start, end - start, "..") == 0) {
            return true;
        }
        start = end + 1;
    }
    return false;
}

std::string withValue(ValidationErrorCode code, const std::string& value) {
    std::string message = ValidationErrorCodeHelper::getMessage(code);
    if (value.size() <= constants::limits::MAX_ECHOED_NOTE_NAME_LENGTH) {
        message += ": '" + value + "'";
    }
    return message;
}

}

bool ConfigValidator::isModifier(const std::string& token) {
    return !canonicalModifier(token).empty();
}

std::optional<ValidationError> ConfigValidator::validateNotesDirectory(const std::string& path) {
    if (path.empty()) {
        return makeError(ValidationErrorCode::PATH_EMPTY, "Notes directory cannot be empty");
    }

    if (hasParentComponent(path)) {
        return makeError(ValidationErrorCode::PATH_TRAVERSAL,
                         "Path traversal not allowed in notes directory");
    }

    if (path.front() == '.') {
        return makeError(ValidationErrorCode::PATH_HIDDEN,
                         "Notes directory cannot start with a dot");
    }

    if (path.size() > constants::limits::MAX_PATH_LENGTH) {
        return makeError(ValidationErrorCode::PATH_TOO_LONG,
            fmt::format("Notes directory too long (max {} characters)", constants::limits::MAX_PATH_LENGTH));
    }

    static const std::string INVALID_CHARACTERS = "<>\"|?*";
    bool has_invalid = std::any_of(path.begin(), path.end(), [](unsigned char c) {
        return c < 0x20 || c == 0x7f || INVALID_CHARACTERS.find(static_cast<char>(c)) != std::string::npos;
    });
    if (has_invalid) {
        return makeError(ValidationErrorCode::PATH_INVALID_CHARACTERS,
                         "Notes directory contains invalid characters");
    }

    return std::nullopt;
}

std::optional<ValidationError> ConfigValidator::validateShortcutFormat(const std::string& shortcut) {
    ParsedShortcut parsed;
    if (auto error = tokenize(shortcut, parsed)) {
        return error;
    }

    if (parsed.modifiers.empty()) {
        return makeError(ValidationErrorCode::SHORTCUT_MISSING_MODIFIER);
    }

    std::set<std::string> seen;
    for (const auto& modifier : parsed.modifiers) {
        if (!seen.insert(canonicalModifier(modifier)).second) {
            return makeError(ValidationErrorCode::SHORTCUT_DUPLICATE_MODIFIER,
                             fmt::format("Modifier '{}' used more than once", modifier));
        }
    }

    if (!isRecognizedKey(parsed.key)) {
        return makeError(ValidationErrorCode::SHORTCUT_INVALID_KEY,
                         fmt::format("Unrecognized key '{}'", parsed.key));
    }

    return std::nullopt;
}

std::optional<ValidationError> ConfigValidator::validateBasicShortcutFormat(const std::string& shortcut) {
    ParsedShortcut parsed;
    if (auto error = tokenize(shortcut, parsed)) {
        return error;
    }

    if (parsed.key.size() > constants::limits::MAX_BASIC_KEY_LENGTH) {
        return makeError(ValidationErrorCode::SHORTCUT_INVALID_KEY,
            fmt::format("Shortcut key too long (max {} characters)", constants::limits::MAX_BASIC_KEY_LENGTH));
    }

    return std::nullopt;
}

std::optional<ValidationError> ConfigValidator::validateFontSize(uint16_t size, const std::string& label) {
    return validateRange(size, constants::limits::MIN_FONT_SIZE, constants::limits::MAX_FONT_SIZE, label);
}

std::optional<ValidationError> ConfigValidator::validateRange(uint64_t value, uint64_t min, uint64_t max,
                                                              const std::string& label) {
    if (value < min) {
        return makeError(ValidationErrorCode::VALUE_OUT_OF_RANGE,
                         fmt::format("{} {} is below minimum {}", label, value, min));
    }
    if (value > max) {
        return makeError(ValidationErrorCode::VALUE_OUT_OF_RANGE,
                         fmt::format("{} {} exceeds maximum {}", label, value, max));
    }
    return std::nullopt;
}

std::optional<ValidationError> ConfigValidator::validateNoteName(const std::string& name) {
    if (name.empty()) {
        return makeError(ValidationErrorCode::NOTE_NAME_EMPTY);
    }

    if (name.find("..") != std::string::npos) {
        return makeError(ValidationErrorCode::NOTE_NAME_TRAVERSAL,
                         withValue(ValidationErrorCode::NOTE_NAME_TRAVERSAL, name));
    }

    if (name.front() == '.') {
        return makeError(ValidationErrorCode::NOTE_NAME_HIDDEN,
                         withValue(ValidationErrorCode::NOTE_NAME_HIDDEN, name));
    }

    if (name.size() > constants::limits::MAX_NOTE_NAME_LENGTH) {
        return makeError(ValidationErrorCode::NOTE_NAME_TOO_LONG,
            fmt::format("Note name too long (max {} characters)", constants::limits::MAX_NOTE_NAME_LENGTH));
    }

    static const std::string INVALID_CHARACTERS = "\\<>:\"|?*";
    bool has_invalid = name.front() == '/' ||
        std::any_of(name.begin(), name.end(), [](unsigned char c) {
            return c < 0x20 || c == 0x7f || INVALID_CHARACTERS.find(static_cast<char>(c)) != std::string::npos;
        });
    if (has_invalid) {
        return makeError(ValidationErrorCode::NOTE_NAME_INVALID,
                         withValue(ValidationErrorCode::NOTE_NAME_INVALID, name));
    }

    return std::nullopt;
}

ValidationResult ConfigValidator::validate(const common::AppConfig& config) {
    ValidationResult result;

    auto report = [&result](const std::string& field, const std::optional<ValidationError>& error) {
        if (error) {
            result.errors.push_back(field + ": " + error->message);
            result.is_valid = false;
        }
    };

    auto reportChoice = [&result](const std::string& field, const std::string& value, bool supported) {
        if (!supported) {
            result.errors.push_back(field + ": " + ConfigMasker::forLog(value) +
                                    " is not one of the available choices");
            result.is_valid = false;
        }
    };

    common::Logger::instance().debug("[Validator] Starting validation");

    report("notes_directory", validateNotesDirectory(config.notes_directory));
    report("global_shortcut", validateShortcutFormat(config.global_shortcut));

    const auto& ui = config.interface;
    reportChoice("interface.ui_theme", ui.ui_theme, catalogs::ui_themes::isSupported(ui.ui_theme));
    reportChoice("interface.markdown_render_theme", ui.markdown_render_theme,
                 catalogs::markdown_themes::isSupported(ui.markdown_render_theme));
    reportChoice("interface.md_render_code_theme", ui.md_render_code_theme,
                 catalogs::code_themes::isSupported(ui.md_render_code_theme));
    report("interface.font_size", validateFontSize(ui.font_size, "UI font size"));
    report("interface.editor_font_size", validateFontSize(ui.editor_font_size, "Editor font size"));

    const auto& editor = config.editor;
    reportChoice("editor.mode", editor.mode, catalogs::editor_modes::isSupported(editor.mode));
    reportChoice("editor.theme", editor.theme, catalogs::editor_themes::isSupported(editor.theme));
    report("editor.tab_size", validateRange(editor.tab_size, constants::limits::MIN_TAB_SIZE,
                                            constants::limits::MAX_TAB_SIZE, "Tab size"));

    for (const auto& field : shortcutFields()) {
        report(std::string("shortcuts.") + field.name,
               validateBasicShortcutFormat(config.shortcuts.*field.member));
    }

    report("preferences.max_search_results",
           validateRange(config.preferences.max_search_results,
                         constants::limits::MIN_SEARCH_RESULTS,
                         constants::limits::MAX_SEARCH_RESULTS, "Max search results"));

    if (result.is_valid) {
        common::Logger::instance().info("[Validator] Passed");
    } else {
        common::Logger::instance().warn("[Validator] Failed | errors={}", result.errors.size());
    }

    return result;
}

std::string ConfigMasker::display(const std::string& value, size_t max_length) {
    if (value.size() > max_length) {
        return fmt::format("<withheld: {} bytes>", value.size());
    }
    return "'" + value + "'";
}

std::string ConfigMasker::forLog(const std::string& value) {
    return display(value, constants::limits::MAX_LOGGED_VALUE_LENGTH);
}

}}
