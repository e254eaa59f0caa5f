#include "rigd/logging/logger.hpp"

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <algorithm>
#include <cctype>
#include <iostream>
#include <mutex>
#include <vector>

namespace rigd::logging {

namespace {

std::shared_ptr<spdlog::logger> g_logger;
std::mutex g_mutex;

spdlog::level::level_enum toSpdlogLevel(LogLevel level) {
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

}  // namespace

bool initialize(const LogConfig& config) {
    std::scoped_lock lock(g_mutex);

    try {
        std::vector<spdlog::sink_ptr> sinks;
        sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
        if (!config.filePath.empty()) {
            sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                config.filePath, config.maxFileSize, config.maxBackups));
        }

        auto logger = std::make_shared<spdlog::logger>("rigd", sinks.begin(), sinks.end());
        logger->set_level(toSpdlogLevel(config.level));
        logger->set_pattern(config.pattern);
        logger->flush_on(spdlog::level::warn);

        g_logger = logger;
        spdlog::set_default_logger(logger);
        return true;
    } catch (const spdlog::spdlog_ex& ex) {
        std::cerr << "[Logging] Failed to initialize: " << ex.what() << std::endl;
        return false;
    }
}

void shutdown() {
    std::scoped_lock lock(g_mutex);
    if (g_logger) {
        g_logger->flush();
    }
    g_logger.reset();
    spdlog::shutdown();
}

std::shared_ptr<spdlog::logger> getLogger() {
    std::scoped_lock lock(g_mutex);
    if (!g_logger) {
        g_logger = spdlog::default_logger();
    }
    return g_logger;
}

LogLevel stringToLevel(std::string_view name) {
    std::string lowered(name);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lowered == "trace") {
        return LogLevel::Trace;
    }
    if (lowered == "debug") {
        return LogLevel::Debug;
    }
    if (lowered == "warn" || lowered == "warning") {
        return LogLevel::Warn;
    }
    if (lowered == "error") {
        return LogLevel::Error;
    }
    if (lowered == "critical") {
        return LogLevel::Critical;
    }
    if (lowered == "off") {
        return LogLevel::Off;
    }
    return LogLevel::Info;
}

std::string_view levelToString(LogLevel level) {
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

}  // namespace rigd::logging
