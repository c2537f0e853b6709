// =============================================================================
// logq - Logger Module
// =============================================================================
// Low-latency asynchronous logging using Quill library.
//
// This module provides a global logger instance with support for:
// - Multiple log levels (trace, debug, info, warning, error, critical)
// - Console and file output
// - Thread-safe logging from scan workers (Quill is inherently thread-safe)
//
// Usage:
//   logq::log::init({.logFile = "logq.log", .level = logq::log::Level::kInfo});
//   LOGQ_LOG_INFO("Scanned {} files", 42);
// =============================================================================

#ifndef LOGQ_COMMON_LOGGER_H
#define LOGQ_COMMON_LOGGER_H

#include <string>
#include <string_view>

#include <quill/Backend.h>
#include <quill/Frontend.h>
#include <quill/LogMacros.h>
#include <quill/Logger.h>
#include <quill/sinks/ConsoleSink.h>
#include <quill/sinks/FileSink.h>

namespace logq::log {

// =============================================================================
// Log Level Enumeration
// =============================================================================

/// @brief Log level enumeration matching Quill's log levels.
enum class Level {
    kTrace = 0,
    kDebug,
    kInfo,
    kWarning,
    kError,
    kCritical
};

// =============================================================================
// Logger Configuration
// =============================================================================

/// @brief Configuration options for logger initialization.
struct Config {
    /// @brief Log file path. Empty string disables file logging.
    std::string logFile;

    /// @brief Minimum log level to output.
    Level level = Level::kInfo;

    /// @brief Enable console output.
    bool enableConsole = true;

    /// @brief Logger name for identification.
    std::string loggerName = "logq";
};

// =============================================================================
// Logger Initialization and Access
// =============================================================================

/// @brief Initialize the global logger with the specified configuration.
/// @note Only the first call takes effect.
void init(const Config& config);

/// @brief Get the global logger instance.
/// @note Initializes a default console logger on first use if init() was
///       never called, so library code can log unconditionally.
[[nodiscard]] quill::Logger* logger();

/// @brief Check if the logger has been initialized.
[[nodiscard]] bool isInitialized() noexcept;

/// @brief Flush all pending log messages.
void flush();

/// @brief Shutdown the logging system.
/// @note Flushes all pending messages and stops the backend thread.
void shutdown();

// =============================================================================
// Level Conversion Utilities
// =============================================================================

/// @brief Convert logq::log::Level to Quill's LogLevel.
[[nodiscard]] quill::LogLevel toQuillLevel(Level level) noexcept;

/// @brief Convert string to log level (case-insensitive, defaults to kInfo).
[[nodiscard]] Level levelFromString(std::string_view levelStr) noexcept;

/// @brief Convert log level to string.
[[nodiscard]] std::string_view levelToString(Level level) noexcept;

}  // namespace logq::log

// =============================================================================
// Convenience Macros
// =============================================================================

/// @brief Log a trace message.
#define LOGQ_LOG_TRACE(fmt, ...) \
    LOG_TRACE_L1(logq::log::logger(), fmt __VA_OPT__(, ) __VA_ARGS__)

/// @brief Log a debug message.
#define LOGQ_LOG_DEBUG(fmt, ...) \
    LOG_DEBUG(logq::log::logger(), fmt __VA_OPT__(, ) __VA_ARGS__)

/// @brief Log an info message.
#define LOGQ_LOG_INFO(fmt, ...) \
    LOG_INFO(logq::log::logger(), fmt __VA_OPT__(, ) __VA_ARGS__)

/// @brief Log a warning message.
#define LOGQ_LOG_WARNING(fmt, ...) \
    LOG_WARNING(logq::log::logger(), fmt __VA_OPT__(, ) __VA_ARGS__)

/// @brief Log an error message.
#define LOGQ_LOG_ERROR(fmt, ...) \
    LOG_ERROR(logq::log::logger(), fmt __VA_OPT__(, ) __VA_ARGS__)

/// @brief Log a critical message.
#define LOGQ_LOG_CRITICAL(fmt, ...) \
    LOG_CRITICAL(logq::log::logger(), fmt __VA_OPT__(, ) __VA_ARGS__)

#endif  // LOGQ_COMMON_LOGGER_H
