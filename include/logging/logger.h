/**
 * @file logger.h
 * @brief Logging facade for the subtitle pipeline
 *
 * Thin wrapper over spdlog shared by the presenter and the worker process.
 * Every line carries the process role ("main" or "worker") so both
 * processes can append to the same rotating file. Console output goes to
 * stderr; stdout belongs to the subtitle display.
 *
 * Components tag their messages with a bracketed prefix:
 * @code
 *   LOG_INFO("[ASR] lang={} text={}", result.language, result.text);
 *   LOG_EVERY_N(WARN, 50, "[{}] Capture ring overflow", tag_);
 * @endcode
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

namespace rtsub {
namespace logging {

enum class LogLevel : std::uint8_t { Trace, Debug, Info, Warn, Error, Critical, Off };

/**
 * @brief Logger setup
 *
 * Filled from the "logging" section of the worker config:
 * level, file_path, max_file_size, max_backups, console_output,
 * colored_output, pattern.
 */
struct LogConfig {
    LogLevel level = LogLevel::Info;
    std::string processName = "main";                            // Shown as %n
    std::string filePath = "";                                   // Empty = no file output
    size_t maxFileSize = static_cast<size_t>(10 * 1024 * 1024);  // 10 MB
    size_t maxBackups = 3;
    bool consoleOutput = true;
    bool coloredOutput = true;
    std::string pattern = "[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] [%t] %v";
};

/**
 * @brief Create the process logger
 *
 * A second call only updates level and pattern; call shutdown() first to
 * rebuild the sinks.
 *
 * @return false if a sink could not be created (e.g. unwritable log file)
 */
bool initialize(const LogConfig& config = LogConfig{});

// stderr-only logger for the time before the config file has been read
bool initializeEarly(const std::string& processName = "main");

/**
 * @brief Build the logger from the "logging" section of a JSON config
 *
 * A missing file or section gives the defaults. Keys with the wrong type
 * are reported on stderr and skipped; the remaining keys still apply.
 *
 * @param configPath Path to JSON config file
 * @param processName Role name shown in every line ("main" or "worker")
 */
bool initializeFromConfig(const std::string& configPath, const std::string& processName);

// Flush and drop the logger. The next LOG_* call recreates a default one.
void shutdown();

void setLevel(LogLevel level);
LogLevel getLevel();
void flush();

// Initializes with defaults on first use
std::shared_ptr<spdlog::logger> getLogger();

std::string_view levelToString(LogLevel level);

// Case-insensitive; accepts "warning", "err", "fatal", "none". Unknown names give Info.
LogLevel stringToLevel(std::string_view str);

}  // namespace logging
}  // namespace rtsub

#include <spdlog/spdlog.h>

#define RTSUB_LOG_WITH(spdlogMacro, ...)                          \
    do {                                                          \
        auto rtsub_logger_ = ::rtsub::logging::getLogger();       \
        if (rtsub_logger_)                                        \
            spdlogMacro(rtsub_logger_, __VA_ARGS__);              \
    } while (0)

#define LOG_DEBUG(...) RTSUB_LOG_WITH(SPDLOG_LOGGER_DEBUG, __VA_ARGS__)
#define LOG_INFO(...) RTSUB_LOG_WITH(SPDLOG_LOGGER_INFO, __VA_ARGS__)
#define LOG_WARN(...) RTSUB_LOG_WITH(SPDLOG_LOGGER_WARN, __VA_ARGS__)
#define LOG_ERROR(...) RTSUB_LOG_WITH(SPDLOG_LOGGER_ERROR, __VA_ARGS__)
#define LOG_CRITICAL(...) RTSUB_LOG_WITH(SPDLOG_LOGGER_CRITICAL, __VA_ARGS__)

/**
 * @brief Log the 1st, (n+1)th, (2n+1)th ... occurrence at this call site
 *
 * For per-period errors in capture and IO loops.
 */
#define LOG_EVERY_N(level, n, ...)                                     \
    do {                                                               \
        static std::atomic<std::uint64_t> rtsub_log_occurrences_{0};   \
        if (rtsub_log_occurrences_.fetch_add(1) % (n) == 0) {          \
            LOG_##level(__VA_ARGS__);                                  \
        }                                                              \
    } while (0)
