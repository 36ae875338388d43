#pragma once

#include "../common/config.hpp"
#include "../common/logger.hpp"
#include <string>

namespace symiosis {
namespace config {

class ConfigParser {
public:
    explicit ConfigParser(common::EventSink sink = common::Logger::instance().getEventSink());

    // Never throws. Any decode failure yields the full default config and one CONFIG_PARSE event.
    common::AppConfig parse(const std::string& content) const;

    // Decodes on top of `base`; throws on malformed syntax or a type mismatch.
    static common::AppConfig decode(const std::string& content, const common::AppConfig& base);

private:
    common::EventSink sink_;
};

}}
