#pragma once

#include <unordered_map>

namespace symiosis {
namespace common {

template<typename EnumType>
struct ErrorInfo {
    EnumType code;
    const char* code_str;
    const char* default_message;
};

template<typename EnumType>
class ErrorRegistry {
public:
    static const ErrorInfo<EnumType>& getInfo(EnumType code) {
        const auto& map = getInfoMap();
        auto it = map.find(code);
        if (it != map.end()) {
            return it->second;
        }
        static ErrorInfo<EnumType> fallback{code, "UNKNOWN", "Unknown error"};
        return fallback;
    }

    static const char* toString(EnumType code) {
        return getInfo(code).code_str;
    }

    static const char* getMessage(EnumType code) {
        return getInfo(code).default_message;
    }

protected:
    static const std::unordered_map<EnumType, ErrorInfo<EnumType>>& getInfoMap();
};

}}
