/**
 * @file logger.h
 * @brief Process-wide logging for the segue playback engine
 *
 * Thin layer over spdlog: one named logger ("segue") fanned out to a colored
 * console sink and an optional rotating file sink. Components log through the
 * LOG_* macros below and never touch spdlog directly.
 *
 * Real-time threads (mixer callback, output loop) must restrict themselves to
 * LOG_EVERY_N / LOG_ONCE so a misbehaving device cannot flood the sinks.
 */

#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace spdlog {
class logger;
}  // namespace spdlog

namespace segue {
namespace logging {

enum class LogLevel : std::uint8_t { Trace, Debug, Info, Warn, Error, Critical, Off };

struct LogConfig {
    LogLevel level = LogLevel::Info;
    std::string filePath;  // empty = console only
    size_t maxFileSize = static_cast<size_t>(10 * 1024 * 1024);
    size_t maxBackups = 5;
    bool consoleOutput = true;
    bool coloredOutput = true;
    std::string pattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] %v";
};

/**
 * @brief Build (or rebuild) the process logger from @p config.
 *
 * Calling again after a successful initialization replaces the sinks, so the
 * daemon can move from the early stderr logger to the configured one and can
 * re-apply settings on SIGHUP.
 */
bool initialize(const LogConfig& config = LogConfig{});

/// stderr-only logger used before the PID lock and the config file.
bool initializeEarly();

/**
 * @brief Read the "logging" section of a JSON config file and initialize.
 *
 * A missing file or a malformed section falls back to LogConfig defaults.
 */
bool initializeFromConfig(const std::string& configPath);

/**
 * @brief Parse a "logging" JSON object text into @p out.
 *
 * Fields with the wrong type are skipped, the rest still apply.
 * @return false when @p jsonText is not a JSON object.
 */
bool parseLogConfig(const std::string& jsonText, LogConfig& out);

void shutdown();

void setLevel(LogLevel level);
LogLevel getLevel();
void flush();

std::shared_ptr<spdlog::logger> getLogger();

std::string_view levelToString(LogLevel level);

/// Case-insensitive; unknown names map to Info.
LogLevel stringToLevel(std::string_view str);

}  // namespace logging
}  // namespace segue

#include <spdlog/spdlog.h>

// ============================================================
// Logging macros
// ============================================================

#define LOG_TRACE(...)                                 \
    do {                                               \
        auto logger = segue::logging::getLogger();     \
        if (logger)                                    \
            SPDLOG_LOGGER_TRACE(logger, __VA_ARGS__);  \
    } while (0)

#define LOG_DEBUG(...)                                 \
    do {                                               \
        auto logger = segue::logging::getLogger();     \
        if (logger)                                    \
            SPDLOG_LOGGER_DEBUG(logger, __VA_ARGS__);  \
    } while (0)

#define LOG_INFO(...)                                  \
    do {                                               \
        auto logger = segue::logging::getLogger();     \
        if (logger)                                    \
            SPDLOG_LOGGER_INFO(logger, __VA_ARGS__);   \
    } while (0)

#define LOG_WARN(...)                                  \
    do {                                               \
        auto logger = segue::logging::getLogger();     \
        if (logger)                                    \
            SPDLOG_LOGGER_WARN(logger, __VA_ARGS__);   \
    } while (0)

#define LOG_ERROR(...)                                 \
    do {                                               \
        auto logger = segue::logging::getLogger();     \
        if (logger)                                    \
            SPDLOG_LOGGER_ERROR(logger, __VA_ARGS__);  \
    } while (0)

#define LOG_CRITICAL(...)                                \
    do {                                                 \
        auto logger = segue::logging::getLogger();       \
        if (logger)                                      \
            SPDLOG_LOGGER_CRITICAL(logger, __VA_ARGS__); \
    } while (0)

// ============================================================
// Conditional / rate-limited variants
// ============================================================

#define LOG_IF(level, condition, ...) \
    do {                              \
        if (condition)                \
            LOG_##level(__VA_ARGS__); \
    } while (0)

// Logs the 1st, (n+1)th, (2n+1)th ... occurrence of this call site.
#define LOG_EVERY_N(level, n, ...)                            \
    do {                                                      \
        static std::atomic<uint64_t> log_count_##__LINE__{0}; \
        if (log_count_##__LINE__.fetch_add(1) % (n) == 0) {   \
            LOG_##level(__VA_ARGS__);                         \
        }                                                     \
    } while (0)

#define LOG_ONCE(level, ...)                                             \
    do {                                                                 \
        static std::atomic<bool> logged_##__LINE__{false};               \
        bool expected = false;                                           \
        if (logged_##__LINE__.compare_exchange_strong(expected, true)) { \
            LOG_##level(__VA_ARGS__);                                    \
        }                                                                \
    } while (0)
