#pragma once

#include "../common/config.hpp"
#include "error_codes.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace symiosis {
namespace config {

struct ValidationResult {
    bool is_valid = true;
    std::vector<std::string> errors;
};

class ConfigValidator {
public:
    // Reports every invalid field without modifying the config.
    ValidationResult validate(const common::AppConfig& config);

    static std::optional<ValidationError> validateNotesDirectory(const std::string& path);
    static std::optional<ValidationError> validateShortcutFormat(const std::string& shortcut);
    static std::optional<ValidationError> validateBasicShortcutFormat(const std::string& shortcut);
    static std::optional<ValidationError> validateFontSize(uint16_t size, const std::string& label);
    static std::optional<ValidationError> validateRange(uint64_t value, uint64_t min, uint64_t max,
                                                        const std::string& label);
    static std::optional<ValidationError> validateNoteName(const std::string& name);

    static bool isModifier(const std::string& token);
};

class ConfigMasker {
public:
    // Quoted value, or a length placeholder when the value is too long to echo.
    static std::string display(const std::string& value, size_t max_length);
    static std::string forLog(const std::string& value);
};

}}
