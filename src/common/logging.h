#pragma once

/// @file logging.h
/// @brief Process-wide spdlog logger for Guardian
///
/// Logs go to stderr so that stdout stays free for CLI results. The logger
/// can be re-initialized, for example once the CLI has read its configuration.

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include <absl/status/status.h>
#include <spdlog/spdlog.h>

namespace guardian {

/// @brief Log levels matching spdlog levels
enum class LogLevel {
    kTrace = spdlog::level::trace,
    kDebug = spdlog::level::debug,
    kInfo = spdlog::level::info,
    kWarn = spdlog::level::warn,
    kError = spdlog::level::err,
    kCritical = spdlog::level::critical,
    kOff = spdlog::level::off
};

struct LogConfig {
    std::string name = "guardian";
    LogLevel level = LogLevel::kInfo;
    std::string pattern = "[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] [%t] %v";

    bool console = true;

    /// Rotating log file; empty disables file logging
    std::string file_path;
    size_t max_file_size = 10 * 1024 * 1024;
    size_t max_files = 5;
};

/// @brief Install a logger built from @p config, replacing any previous one
/// @return ConfigurationError if the log file cannot be opened; the previous
///         logger stays active in that case
absl::Status InitLogging(const LogConfig& config = LogConfig{});

/// @brief Active logger; a default stderr logger is created on first use
std::shared_ptr<spdlog::logger> GetLogger();

void SetLogLevel(LogLevel level);
LogLevel GetLogLevel();

/// @brief Parse "trace", "debug", "info", "warn"/"warning", "error",
///        "critical" or "off" (case-insensitive)
std::optional<LogLevel> ParseLogLevel(std::string_view name);

std::string LogLevelToString(LogLevel level);

void FlushLogs();

/// @brief Flush and drop the logger; a later GetLogger() starts a fresh one
void ShutdownLogging();

}  // namespace guardian

#define GUARDIAN_LOG_TRACE(...) SPDLOG_LOGGER_TRACE(::guardian::GetLogger(), __VA_ARGS__)
#define GUARDIAN_LOG_DEBUG(...) SPDLOG_LOGGER_DEBUG(::guardian::GetLogger(), __VA_ARGS__)
#define GUARDIAN_LOG_INFO(...) SPDLOG_LOGGER_INFO(::guardian::GetLogger(), __VA_ARGS__)
#define GUARDIAN_LOG_WARN(...) SPDLOG_LOGGER_WARN(::guardian::GetLogger(), __VA_ARGS__)
#define GUARDIAN_LOG_ERROR(...) SPDLOG_LOGGER_ERROR(::guardian::GetLogger(), __VA_ARGS__)
#define GUARDIAN_LOG_CRITICAL(...) SPDLOG_LOGGER_CRITICAL(::guardian::GetLogger(), __VA_ARGS__)
