/**
 * @file logger.cpp
 * @brief spdlog-backed implementation of the logging facade
 */

#include "logging/logger.h"

#include <cctype>
#include <fstream>
#include <iostream>
#include <mutex>
#include <nlohmann/json.hpp>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <utility>
#include <vector>

namespace rtsub {
namespace logging {

namespace {

struct LevelEntry {
    LogLevel level;
    spdlog::level::level_enum spdlogLevel;
    const char* name;
};

constexpr LevelEntry kLevels[] = {
    {LogLevel::Trace, spdlog::level::trace, "trace"},
    {LogLevel::Debug, spdlog::level::debug, "debug"},
    {LogLevel::Info, spdlog::level::info, "info"},
    {LogLevel::Warn, spdlog::level::warn, "warn"},
    {LogLevel::Error, spdlog::level::err, "error"},
    {LogLevel::Critical, spdlog::level::critical, "critical"},
    {LogLevel::Off, spdlog::level::off, "off"},
};

// Alternative spellings accepted in config files
constexpr std::pair<const char*, LogLevel> kAliases[] = {
    {"warning", LogLevel::Warn},
    {"err", LogLevel::Error},
    {"fatal", LogLevel::Critical},
    {"none", LogLevel::Off},
};

spdlog::level::level_enum toSpdlogLevel(LogLevel level) {
    for (const auto& entry : kLevels) {
        if (entry.level == level) {
            return entry.spdlogLevel;
        }
    }
    return spdlog::level::info;
}

LogLevel fromSpdlogLevel(spdlog::level::level_enum level) {
    for (const auto& entry : kLevels) {
        if (entry.spdlogLevel == level) {
            return entry.level;
        }
    }
    return LogLevel::Info;
}

// Process-wide logger, guarded by g_mutex
std::mutex g_mutex;
std::shared_ptr<spdlog::logger> g_logger;
bool g_ready = false;

std::vector<spdlog::sink_ptr> makeSinks(const LogConfig& config) {
    std::vector<spdlog::sink_ptr> sinks;
    const auto level = toSpdlogLevel(config.level);

    if (config.consoleOutput) {
        auto console = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        if (!config.coloredOutput) {
            console->set_color_mode(spdlog::color_mode::never);
        }
        console->set_level(level);
        sinks.push_back(std::move(console));
    }
    if (!config.filePath.empty()) {
        auto file = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            config.filePath, config.maxFileSize, config.maxBackups);
        file->set_level(level);
        sinks.push_back(std::move(file));
    }
    return sinks;
}

template <typename T>
void readKey(const nlohmann::json& section, const char* key, T& out) {
    if (!section.contains(key)) {
        return;
    }
    try {
        out = section.at(key).get<T>();
    } catch (const nlohmann::json::exception& e) {
        std::cerr << "Ignoring logging." << key << ": " << e.what() << std::endl;
    }
}

void applyLoggingSection(const nlohmann::json& section, LogConfig& config) {
    std::string level;
    readKey(section, "level", level);
    if (!level.empty()) {
        config.level = stringToLevel(level);
    }
    readKey(section, "file_path", config.filePath);
    readKey(section, "max_file_size", config.maxFileSize);
    readKey(section, "max_backups", config.maxBackups);
    readKey(section, "console_output", config.consoleOutput);
    readKey(section, "colored_output", config.coloredOutput);
    readKey(section, "pattern", config.pattern);
}

// Caller holds g_mutex
bool buildLocked(const LogConfig& config) {
    try {
        auto sinks = makeSinks(config);
        auto logger =
            std::make_shared<spdlog::logger>(config.processName, sinks.begin(), sinks.end());
        logger->set_level(toSpdlogLevel(config.level));
        logger->set_pattern(config.pattern);
        logger->flush_on(spdlog::level::err);
        spdlog::set_default_logger(logger);
        g_logger = std::move(logger);
    } catch (const spdlog::spdlog_ex& ex) {
        std::cerr << "Logger initialization failed: " << ex.what() << std::endl;
        return false;
    }
    g_ready = true;
    return true;
}

}  // namespace

bool initialize(const LogConfig& config) {
    {
        std::lock_guard<std::mutex> lock(g_mutex);
        if (g_ready) {
            g_logger->set_level(toSpdlogLevel(config.level));
            g_logger->set_pattern(config.pattern);
            return true;
        }
        if (!buildLocked(config)) {
            return false;
        }
    }

    if (config.filePath.empty()) {
        LOG_DEBUG("Logging started for {} (level={})", config.processName,
                  levelToString(config.level));
    } else {
        LOG_INFO("Logging started for {} (level={}, file={}, {} x {} bytes)", config.processName,
                 levelToString(config.level), config.filePath, config.maxBackups,
                 config.maxFileSize);
    }
    return true;
}

bool initializeEarly(const std::string& processName) {
    LogConfig config;
    config.processName = processName;
    config.coloredOutput = false;
    return initialize(config);
}

bool initializeFromConfig(const std::string& configPath, const std::string& processName) {
    LogConfig config;
    config.processName = processName;

    std::ifstream file(configPath);
    if (file) {
        try {
            nlohmann::json root = nlohmann::json::parse(file);
            if (root.contains("logging") && root["logging"].is_object()) {
                applyLoggingSection(root["logging"], config);
            }
        } catch (const nlohmann::json::exception& ex) {
            std::cerr << "Failed to parse logging config " << configPath << ": " << ex.what()
                      << std::endl;
        }
    }
    return initialize(config);
}

void shutdown() {
    std::lock_guard<std::mutex> lock(g_mutex);
    if (g_logger) {
        g_logger->flush();
    }
    g_ready = false;
    spdlog::shutdown();
    g_logger.reset();
}

void setLevel(LogLevel level) {
    auto logger = getLogger();
    if (logger) {
        logger->set_level(toSpdlogLevel(level));
    }
}

LogLevel getLevel() {
    auto logger = getLogger();
    return logger ? fromSpdlogLevel(logger->level()) : LogLevel::Info;
}

void flush() {
    auto logger = getLogger();
    if (logger) {
        logger->flush();
    }
}

std::shared_ptr<spdlog::logger> getLogger() {
    std::lock_guard<std::mutex> lock(g_mutex);
    if (!g_ready) {
        buildLocked(LogConfig{});
    }
    return g_logger;
}

std::string_view levelToString(LogLevel level) {
    for (const auto& entry : kLevels) {
        if (entry.level == level) {
            return entry.name;
        }
    }
    return "info";
}

LogLevel stringToLevel(std::string_view str) {
    std::string lower;
    lower.reserve(str.size());
    for (char c : str) {
        lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    for (const auto& entry : kLevels) {
        if (lower == entry.name) {
            return entry.level;
        }
    }
    for (const auto& alias : kAliases) {
        if (lower == alias.first) {
            return alias.second;
        }
    }
    return LogLevel::Info;
}

}  // namespace logging
}  // namespace rtsub
