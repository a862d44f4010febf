/**
 * @file logger.cpp
 * @brief spdlog-backed logger for the segue playback engine
 */

#include "logging/logger.h"

#include <cctype>
#include <fstream>
#include <iostream>
#include <mutex>
#include <nlohmann/json.hpp>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <vector>

namespace segue {
namespace logging {

namespace {

constexpr const char* kLoggerName = "segue";
constexpr size_t kBacktraceDepth = 32;

std::shared_ptr<spdlog::logger> g_logger;
std::mutex g_init_mutex;
std::atomic<bool> g_initialized{false};

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

LogLevel fromSpdlogLevel(spdlog::level::level_enum level) {
    switch (level) {
    case spdlog::level::trace:
        return LogLevel::Trace;
    case spdlog::level::debug:
        return LogLevel::Debug;
    case spdlog::level::warn:
        return LogLevel::Warn;
    case spdlog::level::err:
        return LogLevel::Error;
    case spdlog::level::critical:
        return LogLevel::Critical;
    case spdlog::level::off:
        return LogLevel::Off;
    default:
        return LogLevel::Info;
    }
}

std::vector<spdlog::sink_ptr> buildSinks(const LogConfig& config) {
    std::vector<spdlog::sink_ptr> sinks;
    if (config.consoleOutput) {
        auto console = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        if (!config.coloredOutput) {
            console->set_color_mode(spdlog::color_mode::never);
        }
        sinks.push_back(console);
    }
    if (!config.filePath.empty()) {
        sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            config.filePath, config.maxFileSize, config.maxBackups));
    }
    return sinks;
}

// Caller holds g_init_mutex.
void installLogger(std::shared_ptr<spdlog::logger> logger, LogLevel level,
                   const std::string& pattern) {
    logger->set_level(toSpdlogLevel(level));
    logger->set_pattern(pattern);
    logger->enable_backtrace(kBacktraceDepth);
    logger->flush_on(spdlog::level::err);
    spdlog::set_default_logger(logger);
    g_logger = std::move(logger);
    g_initialized.store(true, std::memory_order_release);
}

void applyLoggingSection(const nlohmann::json& section, LogConfig& config) {
    if (section.contains("level") && section["level"].is_string()) {
        config.level = stringToLevel(section["level"].get<std::string>());
    }
    if (section.contains("filePath") && section["filePath"].is_string()) {
        config.filePath = section["filePath"].get<std::string>();
    }
    if (section.contains("maxFileSize") && section["maxFileSize"].is_number_unsigned()) {
        config.maxFileSize = section["maxFileSize"].get<size_t>();
    }
    if (section.contains("maxBackups") && section["maxBackups"].is_number_unsigned()) {
        config.maxBackups = section["maxBackups"].get<size_t>();
    }
    if (section.contains("consoleOutput") && section["consoleOutput"].is_boolean()) {
        config.consoleOutput = section["consoleOutput"].get<bool>();
    }
    if (section.contains("coloredOutput") && section["coloredOutput"].is_boolean()) {
        config.coloredOutput = section["coloredOutput"].get<bool>();
    }
    if (section.contains("pattern") && section["pattern"].is_string()) {
        config.pattern = section["pattern"].get<std::string>();
    }
}

}  // namespace

bool initialize(const LogConfig& config) {
    std::lock_guard<std::mutex> lock(g_init_mutex);

    try {
        auto sinks = buildSinks(config);
        auto logger = std::make_shared<spdlog::logger>(kLoggerName, sinks.begin(), sinks.end());
        if (g_logger) {
            g_logger->flush();
        }
        installLogger(std::move(logger), config.level, config.pattern);
    } catch (const spdlog::spdlog_ex& ex) {
        std::cerr << "Logger initialization failed: " << ex.what() << std::endl;
        return false;
    }

    LOG_INFO("Logging initialized (level={})", levelToString(config.level));
    if (!config.filePath.empty()) {
        LOG_INFO("Log file: {} (max {}MB x {} backups)", config.filePath,
                 config.maxFileSize / (1024 * 1024), config.maxBackups);
    }
    return true;
}

bool initializeEarly() {
    std::lock_guard<std::mutex> lock(g_init_mutex);
    if (g_initialized.load(std::memory_order_acquire)) {
        return true;
    }
    try {
        auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        auto logger = std::make_shared<spdlog::logger>(kLoggerName, sink);
        installLogger(std::move(logger), LogLevel::Info, LogConfig{}.pattern);
        return true;
    } catch (const spdlog::spdlog_ex& ex) {
        std::cerr << "Early logger initialization failed: " << ex.what() << std::endl;
        return false;
    }
}

bool parseLogConfig(const std::string& jsonText, LogConfig& out) {
    try {
        auto section = nlohmann::json::parse(jsonText);
        if (!section.is_object()) {
            return false;
        }
        applyLoggingSection(section, out);
        return true;
    } catch (const nlohmann::json::exception& ex) {
        std::cerr << "Failed to parse logging config: " << ex.what() << std::endl;
        return false;
    }
}

bool initializeFromConfig(const std::string& configPath) {
    LogConfig config;

    std::ifstream file(configPath);
    if (file.is_open()) {
        try {
            nlohmann::json json;
            file >> json;
            if (json.contains("logging") && json["logging"].is_object()) {
                applyLoggingSection(json["logging"], config);
            }
        } catch (const nlohmann::json::exception& ex) {
            std::cerr << "Failed to parse logging config: " << ex.what() << std::endl;
            config = LogConfig{};
        }
    }

    return initialize(config);
}

void shutdown() {
    std::lock_guard<std::mutex> lock(g_init_mutex);

    if (g_logger) {
        g_logger->info("Logging shutdown");
        g_logger->flush();
    }

    g_initialized.store(false, std::memory_order_release);
    spdlog::shutdown();
    g_logger.reset();
}

void setLevel(LogLevel level) {
    auto logger = getLogger();
    if (logger) {
        logger->set_level(toSpdlogLevel(level));
        LOG_INFO("Log level changed to {}", levelToString(level));
    }
}

LogLevel getLevel() {
    auto logger = getLogger();
    return logger ? fromSpdlogLevel(logger->level()) : LogLevel::Info;
}

void flush() {
    if (auto logger = getLogger()) {
        logger->flush();
    }
}

std::shared_ptr<spdlog::logger> getLogger() {
    if (g_initialized.load(std::memory_order_acquire)) {
        return g_logger;
    }
    initialize();
    return g_logger;
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

LogLevel stringToLevel(std::string_view str) {
    std::string lower;
    lower.reserve(str.size());
    for (char c : str) {
        lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }

    if (lower == "trace")
        return LogLevel::Trace;
    if (lower == "debug")
        return LogLevel::Debug;
    if (lower == "warn" || lower == "warning")
        return LogLevel::Warn;
    if (lower == "error" || lower == "err")
        return LogLevel::Error;
    if (lower == "critical" || lower == "fatal")
        return LogLevel::Critical;
    if (lower == "off" || lower == "none")
        return LogLevel::Off;
    return LogLevel::Info;
}

}  // namespace logging
}  // namespace segue
