#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace spdlog {
class logger;
}  // namespace spdlog

namespace rigd::logging {

enum class LogLevel : std::uint8_t {
    Trace,
    Debug,
    Info,
    Warn,
    Error,
    Critical,
    Off
};

struct LogConfig {
    LogLevel level{LogLevel::Info};
    std::string filePath{};  // empty = console only
    std::size_t maxFileSize{static_cast<std::size_t>(5 * 1024 * 1024)};
    std::size_t maxBackups{3};
    std::string pattern{"[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v"};
};

/**
 * @brief Install the process-wide logger.
 *
 * Safe to call again once the configuration file is known; later calls only
 * replace sinks and level.
 */
bool initialize(const LogConfig& config = LogConfig{});

void shutdown();
std::shared_ptr<spdlog::logger> getLogger();

// Unknown names map to Info.
LogLevel stringToLevel(std::string_view name);
std::string_view levelToString(LogLevel level);

}  // namespace rigd::logging

#include <spdlog/spdlog.h>

#define RIGD_LOG_DEBUG(...)                               \
    do {                                                  \
        if (auto logger_ = rigd::logging::getLogger()) {  \
            SPDLOG_LOGGER_DEBUG(logger_, __VA_ARGS__);    \
        }                                                 \
    } while (0)

#define RIGD_LOG_INFO(...)                                \
    do {                                                  \
        if (auto logger_ = rigd::logging::getLogger()) {  \
            SPDLOG_LOGGER_INFO(logger_, __VA_ARGS__);     \
        }                                                 \
    } while (0)

#define RIGD_LOG_WARN(...)                                \
    do {                                                  \
        if (auto logger_ = rigd::logging::getLogger()) {  \
            SPDLOG_LOGGER_WARN(logger_, __VA_ARGS__);     \
        }                                                 \
    } while (0)

#define RIGD_LOG_ERROR(...)                               \
    do {                                                  \
        if (auto logger_ = rigd::logging::getLogger()) {  \
            SPDLOG_LOGGER_ERROR(logger_, __VA_ARGS__);    \
        }                                                 \
    } while (0)
