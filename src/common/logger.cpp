#include "symiosis/common/logger.hpp"
#include "symiosis/common/constants.hpp"
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <iostream>
#include <filesystem>
#include <algorithm>
#include <cctype>

namespace symiosis {
namespace common {

Logger& Logger::instance() {
    static Logger instance;
    return instance;
}

void Logger::initialize(LogMode mode, const std::string& log_file, LogLevel level,
                        const LogFileOptions& options) {
    if (initialized_) {
        if (logger_) {
            logger_->warn("[Logger] Already initialized, ignoring duplicate initialization");
        }
        return;
    }

    const std::string name = constants::system::LOGGER_NAME;

    if (logger_) {
        spdlog::drop(name);
        logger_.reset();
    }

    auto spdlog_level = toSpdlogLevel(level);
    std::vector<spdlog::sink_ptr> sinks;

    try {
        if (mode == LogMode::FILE_ONLY) {
            if (log_file.empty()) {
                throw spdlog::spdlog_ex("Log file path required for FILE_ONLY mode");
            }

            std::filesystem::path log_dir = std::filesystem::path(log_file).parent_path();

            std::error_code ec;
            if (!log_dir.empty() && !std::filesystem::exists(log_dir, ec)) {
                std::filesystem::create_directories(log_dir, ec);
                if (ec) {
                    throw spdlog::spdlog_ex("Failed to create log directory: " + ec.message());
                }
            }

            size_t max_size = options.rotation_size_mb * 1024 * 1024;
            auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                log_file, max_size, options.max_files);
            file_sink->set_level(spdlog_level);
            sinks.push_back(file_sink);
        } else {
            auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
            console_sink->set_level(spdlog_level);
            sinks.push_back(console_sink);
        }
    } catch (const spdlog::spdlog_ex& ex) {
        std::cerr << "[Logger] Failed to open log file: " << log_file
                  << " - " << ex.what() << std::endl;
        std::cerr << "[Logger] Falling back to console output" << std::endl;
        sinks.clear();
        auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        console_sink->set_level(spdlog_level);
        sinks.push_back(console_sink);
        mode = LogMode::CONSOLE_ONLY;
    }

    logger_ = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
    logger_->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
    logger_->set_level(spdlog_level);

    if (mode == LogMode::FILE_ONLY) {
        logger_->flush_on(spdlog::level::warn);
    }

    spdlog::register_logger(logger_);
    initialized_ = true;
}

void Logger::shutdown() {
    if (logger_) {
        logger_->flush();
        spdlog::drop(constants::system::LOGGER_NAME);
        logger_.reset();
    }
    initialized_ = false;
}

void Logger::event(const std::string& category, const std::string& message,
                   const std::optional<std::string>& detail) {
    if (!logger_) return;

    if (detail) {
        logger_->warn("[{}] {} | detail={}", category, message, *detail);
    } else {
        logger_->warn("[{}] {}", category, message);
    }
}

EventSink Logger::getEventSink() {
    return &Logger::eventCallback;
}

void Logger::eventCallback(const std::string& category, const std::string& message,
                           const std::optional<std::string>& detail) {
    Logger::instance().event(category, message, detail);
}

spdlog::level::level_enum Logger::toSpdlogLevel(LogLevel level) {
    switch (level) {
        case LogLevel::ERROR: return spdlog::level::err;
        case LogLevel::WARN: return spdlog::level::warn;
        case LogLevel::INFO: return spdlog::level::info;
        case LogLevel::DEBUG: return spdlog::level::debug;
        default: return spdlog::level::info;
    }
}

std::optional<LogLevel> parseLogLevel(const std::string& level) {
    std::string upper = level;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    if (upper == "DEBUG") return LogLevel::DEBUG;
    if (upper == "INFO") return LogLevel::INFO;
    if (upper == "WARN") return LogLevel::WARN;
    if (upper == "ERROR") return LogLevel::ERROR;
    return std::nullopt;
}

}}
