#pragma once

#include "../common/config.hpp"
#include "../common/logger.hpp"
#include "error_codes.hpp"
#include <optional>
#include <string>

namespace symiosis {
namespace config {

class ConfigSanitizer {
public:
    explicit ConfigSanitizer(common::EventSink sink = common::Logger::instance().getEventSink());

    // Replaces every invalid field with the matching field of `defaults`, one event per
    // replacement. Returns the number of fields replaced.
    size_t sanitize(common::AppConfig& config, const common::AppConfig& defaults) const;

private:
    common::EventSink sink_;

    template<typename Check>
    bool correctString(const std::string& field, std::string& value, const std::string& fallback,
                       Check check) const;

    bool correctChoice(const std::string& field, std::string& value, const std::string& fallback,
                       bool supported) const;

    template<typename T>
    bool correctNumber(const std::string& field, T& value, T fallback,
                       const std::optional<ValidationError>& error) const;

    size_t sanitizeInterface(common::InterfaceConfig& config, const common::InterfaceConfig& defaults) const;
    size_t sanitizeEditor(common::EditorConfig& config, const common::EditorConfig& defaults) const;
    size_t sanitizeShortcuts(common::ShortcutsConfig& config, const common::ShortcutsConfig& defaults) const;
    size_t sanitizePreferences(common::PreferencesConfig& config,
                               const common::PreferencesConfig& defaults) const;

    void emit(const std::string& message, const std::optional<std::string>& detail) const;
};

// Parses `content` and sanitizes the result against the default config.
common::AppConfig loadConfigFromContent(const std::string& content,
                                        const common::EventSink& sink = common::Logger::instance().getEventSink());

}}
