/// @file logging.cpp
/// @brief Logger construction and level handling

#include "common/logging.h"

#include <mutex>
#include <vector>

#include <absl/strings/ascii.h>
#include <absl/strings/str_cat.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include "common/error.h"

namespace guardian {

namespace {

std::mutex g_mutex;
std::shared_ptr<spdlog::logger> g_logger;  // guarded by g_mutex

spdlog::level::level_enum ToSpdlog(LogLevel level) {
    return static_cast<spdlog::level::level_enum>(level);
}

// Builds a logger without touching the registry; throws spdlog::spdlog_ex
// when the file sink cannot be created
std::shared_ptr<spdlog::logger> BuildLogger(const LogConfig& config) {
    std::vector<spdlog::sink_ptr> sinks;
    if (config.console) {
        sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
    }
    if (!config.file_path.empty()) {
        sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            config.file_path, config.max_file_size, config.max_files));
    }

    auto logger = std::make_shared<spdlog::logger>(config.name, sinks.begin(), sinks.end());
    logger->set_pattern(config.pattern);
    logger->set_level(ToSpdlog(config.level));
    logger->flush_on(spdlog::level::warn);
    return logger;
}

}  // namespace

absl::Status InitLogging(const LogConfig& config) {
    std::shared_ptr<spdlog::logger> logger;
    try {
        logger = BuildLogger(config);
    } catch (const spdlog::spdlog_ex& e) {
        return ConfigurationError(
            absl::StrCat("Cannot open log file ", config.file_path, ": ", e.what()));
    }

    std::shared_ptr<spdlog::logger> previous;
    {
        std::lock_guard<std::mutex> lock(g_mutex);
        previous = std::move(g_logger);
        g_logger = std::move(logger);
    }
    if (previous) {
        previous->flush();
    }
    return OkStatus();
}

std::shared_ptr<spdlog::logger> GetLogger() {
    std::lock_guard<std::mutex> lock(g_mutex);
    if (!g_logger) {
        g_logger = BuildLogger(LogConfig{});
    }
    return g_logger;
}

void SetLogLevel(LogLevel level) {
    GetLogger()->set_level(ToSpdlog(level));
}

LogLevel GetLogLevel() {
    return static_cast<LogLevel>(GetLogger()->level());
}

std::optional<LogLevel> ParseLogLevel(std::string_view name) {
    const std::string lower = absl::AsciiStrToLower(std::string(name));
    for (LogLevel level : {LogLevel::kTrace, LogLevel::kDebug, LogLevel::kInfo,
                           LogLevel::kWarn, LogLevel::kError, LogLevel::kCritical,
                           LogLevel::kOff}) {
        if (LogLevelToString(level) == lower) {
            return level;
        }
    }
    if (lower == "warning") {
        return LogLevel::kWarn;
    }
    return std::nullopt;
}

std::string LogLevelToString(LogLevel level) {
    switch (level) {
        case LogLevel::kTrace: return "trace";
        case LogLevel::kDebug: return "debug";
        case LogLevel::kInfo: return "info";
        case LogLevel::kWarn: return "warn";
        case LogLevel::kError: return "error";
        case LogLevel::kCritical: return "critical";
        case LogLevel::kOff: return "off";
    }
    return "info";
}

void FlushLogs() {
    GetLogger()->flush();
}

void ShutdownLogging() {
    std::shared_ptr<spdlog::logger> logger;
    {
        std::lock_guard<std::mutex> lock(g_mutex);
        logger = std::move(g_logger);
    }
    if (logger) {
        logger->flush();
    }
}

}  // namespace guardian
