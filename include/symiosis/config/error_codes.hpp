#pragma once

#include "../common/error_framework.hpp"
#include <string>
#include <unordered_map>

namespace symiosis {
namespace config {

enum class ValidationErrorCode {
    PATH_EMPTY = 100,
    PATH_TRAVERSAL = 101,
    PATH_HIDDEN = 102,
    PATH_TOO_LONG = 103,
    PATH_INVALID_CHARACTERS = 104,

    SHORTCUT_EMPTY = 200,
    SHORTCUT_TOO_LONG = 201,
    SHORTCUT_MALFORMED = 202,
    SHORTCUT_UNKNOWN_MODIFIER = 203,
    SHORTCUT_DUPLICATE_MODIFIER = 204,
    SHORTCUT_MISSING_MODIFIER = 205,
    SHORTCUT_INVALID_KEY = 206,

    VALUE_OUT_OF_RANGE = 300,
    VALUE_NOT_IN_CATALOG = 301,

    NOTE_NAME_EMPTY = 400,
    NOTE_NAME_TRAVERSAL = 401,
    NOTE_NAME_HIDDEN = 402,
    NOTE_NAME_TOO_LONG = 403,
    NOTE_NAME_INVALID = 404
};

struct ValidationError {
    ValidationErrorCode code;
    std::string message;
};

using ValidationErrorCodeHelper = common::ErrorRegistry<ValidationErrorCode>;

}
}

namespace symiosis {
namespace common {

template<>
inline const std::unordered_map<config::ValidationErrorCode, ErrorInfo<config::ValidationErrorCode>>&
ErrorRegistry<config::ValidationErrorCode>::getInfoMap() {
    using config::ValidationErrorCode;
    static const std::unordered_map<ValidationErrorCode, ErrorInfo<ValidationErrorCode>> map = {
        {ValidationErrorCode::PATH_EMPTY, {
            ValidationErrorCode::PATH_EMPTY,
            "PATH_EMPTY",
            "Path cannot be empty"
        }},
        {ValidationErrorCode::PATH_TRAVERSAL, {
            ValidationErrorCode::PATH_TRAVERSAL,
            "PATH_TRAVERSAL",
            "Path traversal not allowed"
        }},
        {ValidationErrorCode::PATH_HIDDEN, {
            ValidationErrorCode::PATH_HIDDEN,
            "PATH_HIDDEN",
            "Path cannot start with a dot"
        }},
        {ValidationErrorCode::PATH_TOO_LONG, {
            ValidationErrorCode::PATH_TOO_LONG,
            "PATH_TOO_LONG",
            "Path too long"
        }},
        {ValidationErrorCode::PATH_INVALID_CHARACTERS, {
            ValidationErrorCode::PATH_INVALID_CHARACTERS,
            "PATH_INVALID_CHARACTERS",
            "Path contains invalid characters"
        }},
        {ValidationErrorCode::SHORTCUT_EMPTY, {
            ValidationErrorCode::SHORTCUT_EMPTY,
            "SHORTCUT_EMPTY",
            "Shortcut cannot be empty"
        }},
        {ValidationErrorCode::SHORTCUT_TOO_LONG, {
            ValidationErrorCode::SHORTCUT_TOO_LONG,
            "SHORTCUT_TOO_LONG",
            "Shortcut too long"
        }},
        {ValidationErrorCode::SHORTCUT_MALFORMED, {
            ValidationErrorCode::SHORTCUT_MALFORMED,
            "SHORTCUT_MALFORMED",
            "Shortcut is malformed"
        }},
        {ValidationErrorCode::SHORTCUT_UNKNOWN_MODIFIER, {
            ValidationErrorCode::SHORTCUT_UNKNOWN_MODIFIER,
            "SHORTCUT_UNKNOWN_MODIFIER",
            "Shortcut uses an unknown modifier"
        }},
        {ValidationErrorCode::SHORTCUT_DUPLICATE_MODIFIER, {
            ValidationErrorCode::SHORTCUT_DUPLICATE_MODIFIER,
            "SHORTCUT_DUPLICATE_MODIFIER",
            "Shortcut repeats a modifier"
        }},
        {ValidationErrorCode::SHORTCUT_MISSING_MODIFIER, {
            ValidationErrorCode::SHORTCUT_MISSING_MODIFIER,
            "SHORTCUT_MISSING_MODIFIER",
            "Shortcut requires at least one modifier"
        }},
        {ValidationErrorCode::SHORTCUT_INVALID_KEY, {
            ValidationErrorCode::SHORTCUT_INVALID_KEY,
            "SHORTCUT_INVALID_KEY",
            "Shortcut key is not recognized"
        }},
        {ValidationErrorCode::VALUE_OUT_OF_RANGE, {
            ValidationErrorCode::VALUE_OUT_OF_RANGE,
            "VALUE_OUT_OF_RANGE",
            "Value out of range"
        }},
        {ValidationErrorCode::VALUE_NOT_IN_CATALOG, {
            ValidationErrorCode::VALUE_NOT_IN_CATALOG,
            "VALUE_NOT_IN_CATALOG",
            "Value is not one of the available choices"
        }},
        {ValidationErrorCode::NOTE_NAME_EMPTY, {
            ValidationErrorCode::NOTE_NAME_EMPTY,
            "NOTE_NAME_EMPTY",
            "Note name cannot be empty"
        }},
        {ValidationErrorCode::NOTE_NAME_TRAVERSAL, {
            ValidationErrorCode::NOTE_NAME_TRAVERSAL,
            "NOTE_NAME_TRAVERSAL",
            "Path traversal not allowed"
        }},
        {ValidationErrorCode::NOTE_NAME_HIDDEN, {
            ValidationErrorCode::NOTE_NAME_HIDDEN,
            "NOTE_NAME_HIDDEN",
            "Note name cannot start with a dot"
        }},
        {ValidationErrorCode::NOTE_NAME_TOO_LONG, {
            ValidationErrorCode::NOTE_NAME_TOO_LONG,
            "NOTE_NAME_TOO_LONG",
            "Note name too long"
        }},
        {ValidationErrorCode::NOTE_NAME_INVALID, {
            ValidationErrorCode::NOTE_NAME_INVALID,
            "NOTE_NAME_INVALID",
            "Invalid note name"
        }}
    };
    return map;
}

}
}
