#pragma once

#include <cstddef>
#include <cstdint>

#include "common/macros.h"

namespace Common {

/// Severity of a log record. Records below the active level are discarded
/// before formatting.
enum class LogLevel : uint16_t {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3,
    FATAL = 4
};

struct LogStats {
    uint64_t messages_written = 0;
    uint64_t messages_dropped = 0;
    uint64_t bytes_written = 0;
};

/// Start the asynchronous file logger. Re-initialising flushes and closes the
/// previous file first. Parent directories of `log_file` are created.
void initLogging(const char* log_file) noexcept;

/// Drain pending records, stop the writer thread and close the file.
void shutdownLogging() noexcept;

[[nodiscard]] auto isLoggingInitialized() noexcept -> bool;

auto setLogLevel(LogLevel level) noexcept -> void;
[[nodiscard]] auto getLogLevel() noexcept -> LogLevel;

/// Case-insensitive "DEBUG" / "INFO" / "WARN" / "ERROR" / "FATAL".
[[nodiscard]] auto parseLogLevel(const char* name, LogLevel fallback) noexcept -> LogLevel;
[[nodiscard]] auto logLevelName(LogLevel level) noexcept -> const char*;

[[nodiscard]] auto getLogStats() noexcept -> LogStats;

/// Format and enqueue one record. Never blocks: when the queue is full the
/// record is counted as dropped.
void logMessage(LogLevel level, const char* format, ...) noexcept PRINTF_FORMAT(2, 3);

} // namespace Common

#define LOG_DEBUG(...) ::Common::logMessage(::Common::LogLevel::DEBUG, __VA_ARGS__)
#define LOG_INFO(...)  ::Common::logMessage(::Common::LogLevel::INFO, __VA_ARGS__)
#define LOG_WARN(...)  ::Common::logMessage(::Common::LogLevel::WARN, __VA_ARGS__)
#define LOG_ERROR(...) ::Common::logMessage(::Common::LogLevel::ERROR, __VA_ARGS__)
#define LOG_FATAL(...) ::Common::logMessage(::Common::LogLevel::FATAL, __VA_ARGS__)
