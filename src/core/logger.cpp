#include "core/logger.hpp"

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <iostream>
#include <mutex>
#include <vector>

namespace fs = std::filesystem;

namespace logging {

namespace {

std::shared_ptr<spdlog::logger> g_logger;
std::mutex g_mutex;

spdlog::level::level_enum to_spdlog(LogLevel level) {
    switch (level) {
    case LogLevel::Trace:
        return spdlog::level::trace;
    case LogLevel::Debug:
        return spdlog::level::debug;
    case LogLevel::Info:
        return spdlog::level::info;
    case LogLevel::Warn:
        return spdlog::level::warn;
    case LogLevel::Error:
        return spdlog::level::err;
    case LogLevel::Critical:
        return spdlog::level::critical;
    case LogLevel::Off:
        return spdlog::level::off;
    }
    return spdlog::level::info;
}

LogLevel from_spdlog(spdlog::level::level_enum level) {
    switch (level) {
    case spdlog::level::trace:
        return LogLevel::Trace;
    case spdlog::level::debug:
        return LogLevel::Debug;
    case spdlog::level::info:
        return LogLevel::Info;
    case spdlog::level::warn:
        return LogLevel::Warn;
    case spdlog::level::err:
        return LogLevel::Error;
    case spdlog::level::critical:
        return LogLevel::Critical;
    default:
        return LogLevel::Off;
    }
}

void install(std::shared_ptr<spdlog::logger> logger) {
    g_logger = std::move(logger);
    spdlog::set_default_logger(g_logger);
}

}  // namespace

bool initialize_early() {
    std::lock_guard<std::mutex> lock(g_mutex);
    if (g_logger) return true;

    try {
        auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        auto logger = std::make_shared<spdlog::logger>("waypoint", sink);
        logger->set_level(spdlog::level::info);
        install(std::move(logger));
        return true;
    } catch (const spdlog::spdlog_ex& ex) {
        std::cerr << "Logger initialization failed: " << ex.what() << std::endl;
        return false;
    }
}

bool initialize(const LogConfig& config) {
    try {
        std::vector<spdlog::sink_ptr> sinks;

        if (config.console_output) {
            auto console = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
            console->set_level(to_spdlog(config.level));
            sinks.push_back(console);
        }

        if (!config.file_path.empty()) {
            std::error_code ec;
            fs::create_directories(fs::path(config.file_path).parent_path(), ec);
            auto file = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                config.file_path, config.max_file_size, config.max_backups);
            file->set_level(to_spdlog(config.level));
            sinks.push_back(file);
        }

        auto logger = std::make_shared<spdlog::logger>("waypoint", sinks.begin(), sinks.end());
        logger->set_level(to_spdlog(config.level));
        logger->set_pattern(config.pattern);
        logger->flush_on(spdlog::level::warn);

        std::lock_guard<std::mutex> lock(g_mutex);
        install(std::move(logger));
    } catch (const spdlog::spdlog_ex& ex) {
        std::cerr << "Logger initialization failed: " << ex.what() << std::endl;
        return false;
    }

    LOG_DEBUG("Logging initialized (level={})", level_to_string(config.level));
    if (!config.file_path.empty()) {
        LOG_DEBUG("Log file: {}", config.file_path);
    }
    return true;
}

void shutdown() {
    std::lock_guard<std::mutex> lock(g_mutex);
    if (g_logger) {
        g_logger->flush();
    }
    spdlog::shutdown();
    g_logger.reset();
}

void set_level(LogLevel level) {
    std::lock_guard<std::mutex> lock(g_mutex);
    if (g_logger) {
        g_logger->set_level(to_spdlog(level));
        for (auto& sink : g_logger->sinks()) {
            sink->set_level(to_spdlog(level));
        }
    }
}

LogLevel level() {
    std::lock_guard<std::mutex> lock(g_mutex);
    if (!g_logger) return LogLevel::Off;
    return from_spdlog(g_logger->level());
}

void flush() {
    auto logger = get_logger();
    if (logger) logger->flush();
}

std::shared_ptr<spdlog::logger> get_logger() {
    std::lock_guard<std::mutex> lock(g_mutex);
    return g_logger;
}

std::string level_to_string(LogLevel level) {
    switch (level) {
    case LogLevel::Trace:
        return "trace";
    case LogLevel::Debug:
        return "debug";
    case LogLevel::Info:
        return "info";
    case LogLevel::Warn:
        return "warn";
    case LogLevel::Error:
        return "error";
    case LogLevel::Critical:
        return "critical";
    case LogLevel::Off:
        return "off";
    }
    return "info";
}

LogLevel string_to_level(const std::string& str) {
    std::string lower = str;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "trace") return LogLevel::Trace;
    if (lower == "debug") return LogLevel::Debug;
    if (lower == "info") return LogLevel::Info;
    if (lower == "warn" || lower == "warning") return LogLevel::Warn;
    if (lower == "error" || lower == "err") return LogLevel::Error;
    if (lower == "critical") return LogLevel::Critical;
    if (lower == "off") return LogLevel::Off;
    return LogLevel::Info;
}

}  // namespace logging
