#pragma once

#include "config.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace symiosis {
namespace common {

enum class LogMode {
    CONSOLE_ONLY,
    FILE_ONLY
};

struct LogFileOptions {
    size_t rotation_size_mb = 10;
    size_t max_files = 3;
};

// Receives one diagnostic event: a fixed category tag, a message and an optional detail.
using EventSink = std::function<void(const std::string& category,
                                     const std::string& message,
                                     const std::optional<std::string>& detail)>;

class Logger {
public:
    static Logger& instance();

    void initialize(LogMode mode, const std::string& log_file, LogLevel level,
                    const LogFileOptions& options = LogFileOptions{});
    void shutdown();

    template<typename... Args>
    void error(const std::string& format, Args&&... args) {
        if (logger_) logger_->error(fmt::runtime(format), std::forward<Args>(args)...);
    }

    template<typename... Args>
    void warn(const std::string& format, Args&&... args) {
        if (logger_) logger_->warn(fmt::runtime(format), std::forward<Args>(args)...);
    }

    template<typename... Args>
    void info(const std::string& format, Args&&... args) {
        if (logger_) logger_->info(fmt::runtime(format), std::forward<Args>(args)...);
    }

    template<typename... Args>
    void debug(const std::string& format, Args&&... args) {
        if (logger_) logger_->debug(fmt::runtime(format), std::forward<Args>(args)...);
    }

    void event(const std::string& category, const std::string& message,
               const std::optional<std::string>& detail = std::nullopt);

    EventSink getEventSink();

private:
    Logger() = default;
    std::shared_ptr<spdlog::logger> logger_;
    bool initialized_ = false;

    spdlog::level::level_enum toSpdlogLevel(LogLevel level);

    static void eventCallback(const std::string& category, const std::string& message,
                              const std::optional<std::string>& detail);
};

std::optional<LogLevel> parseLogLevel(const std::string& level);

}}
