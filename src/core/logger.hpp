#pragma once

#include <cstddef>
#include <memory>
#include <string>

namespace spdlog {
class logger;
}  // namespace spdlog

namespace logging {

enum class LogLevel {
    Trace,
    Debug,
    Info,
    Warn,
    Error,
    Critical,
    Off,
};

struct LogConfig {
    LogLevel level = LogLevel::Info;
    std::string file_path;                    // empty = no file output
    std::size_t max_file_size = 5 * 1024 * 1024;
    std::size_t max_backups = 3;
    bool console_output = true;
    std::string pattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] %v";
};

/// Stderr-only logger for the window before the data directory is known.
bool initialize_early();

/// Full initialization. Safe to call again; later calls replace the sinks.
bool initialize(const LogConfig& config);

void shutdown();

void set_level(LogLevel level);
LogLevel level();

void flush();

/// May return nullptr before initialization.
std::shared_ptr<spdlog::logger> get_logger();

std::string level_to_string(LogLevel level);

/// Case-insensitive. Unknown names map to Info.
LogLevel string_to_level(const std::string& str);

}  // namespace logging

#include <spdlog/spdlog.h>

#define LOG_DEBUG(...)                                  \
    do {                                                \
        auto wp_logger_ = ::logging::get_logger();      \
        if (wp_logger_)                                 \
            SPDLOG_LOGGER_DEBUG(wp_logger_, __VA_ARGS__); \
    } while (0)

#define LOG_INFO(...)                                   \
    do {                                                \
        auto wp_logger_ = ::logging::get_logger();      \
        if (wp_logger_)                                 \
            SPDLOG_LOGGER_INFO(wp_logger_, __VA_ARGS__); \
    } while (0)

#define LOG_WARN(...)                                   \
    do {                                                \
        auto wp_logger_ = ::logging::get_logger();      \
        if (wp_logger_)                                 \
            SPDLOG_LOGGER_WARN(wp_logger_, __VA_ARGS__); \
    } while (0)

#define LOG_ERROR(...)                                  \
    do {                                                \
        auto wp_logger_ = ::logging::get_logger();      \
        if (wp_logger_)                                 \
            SPDLOG_LOGGER_ERROR(wp_logger_, __VA_ARGS__); \
    } while (0)
