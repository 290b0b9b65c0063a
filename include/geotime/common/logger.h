// =============================================================================
// geotime - Logger Module
// =============================================================================
// Low-latency asynchronous logging using Quill library.
//
// This module provides a global logger instance with support for:
// - Multiple log levels (trace, debug, info, warning, error, critical)
// - Console and file output
// - Library code logs only once the application has called init()
//
// Usage:
//   geotime::log::init("geotime.log", geotime::log::Level::kDebug);
//   GEOTIME_LOG_DEBUG("Calendar tier rejected value: {}", reason);
// =============================================================================

#ifndef GEOTIME_COMMON_LOGGER_H
#define GEOTIME_COMMON_LOGGER_H

#include <string>
#include <string_view>

#include <quill/Backend.h>
#include <quill/Frontend.h>
#include <quill/LogMacros.h>
#include <quill/Logger.h>
#include <quill/sinks/ConsoleSink.h>
#include <quill/sinks/FileSink.h>

namespace geotime::log {

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
    Level level = Level::kWarning;

    /// @brief Enable console (stderr) output.
    bool enableConsole = true;

    /// @brief Logger name for identification.
    std::string loggerName = "geotime";
};

// =============================================================================
// Logger Initialization and Access
// =============================================================================

/// @brief Initialize the global logger with the specified configuration.
/// @note Has no effect if the logger is already initialized; call shutdown()
///       first to reconfigure.
void init(const Config& config);

/// @brief Initialize the global logger with default settings.
/// @param logFile Path to log file. Empty string disables file logging.
/// @param level Minimum log level to output.
void init(std::string_view logFile = "", Level level = Level::kWarning);

/// @brief Get the global logger instance.
/// @return Pointer to the global Quill logger, or nullptr before init().
/// @note Never starts the backend; the GEOTIME_LOG_* macros skip logging
///       while this returns nullptr.
[[nodiscard]] quill::Logger* logger() noexcept;

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

/// @brief Convert geotime::log::Level to Quill's LogLevel.
[[nodiscard]] quill::LogLevel toQuillLevel(Level level) noexcept;

/// @brief Convert string to log level.
/// @param levelStr String representation (case-insensitive).
/// @return Corresponding log level, defaults to kInfo for unknown strings.
[[nodiscard]] Level levelFromString(std::string_view levelStr) noexcept;

/// @brief Convert log level to string.
[[nodiscard]] std::string_view levelToString(Level level) noexcept;

}  // namespace geotime::log

// =============================================================================
// Convenience Macros
// =============================================================================

/// @brief Forward to a Quill macro when a logger has been initialized.
#define GEOTIME_LOG_IMPL(quillMacro, fmt, ...)                                   \
    do {                                                                          \
        if (quill::Logger* geotimeLogger_ = geotime::log::logger()) {             \
            quillMacro(geotimeLogger_, fmt __VA_OPT__(, ) __VA_ARGS__);           \
        }                                                                         \
    } while (0)

/// @brief Log a trace message.
#define GEOTIME_LOG_TRACE(fmt, ...) \
    GEOTIME_LOG_IMPL(LOG_TRACE_L1, fmt __VA_OPT__(, ) __VA_ARGS__)

/// @brief Log a debug message.
#define GEOTIME_LOG_DEBUG(fmt, ...) \
    GEOTIME_LOG_IMPL(LOG_DEBUG, fmt __VA_OPT__(, ) __VA_ARGS__)

/// @brief Log an info message.
#define GEOTIME_LOG_INFO(fmt, ...) \
    GEOTIME_LOG_IMPL(LOG_INFO, fmt __VA_OPT__(, ) __VA_ARGS__)

/// @brief Log a warning message.
#define GEOTIME_LOG_WARNING(fmt, ...) \
    GEOTIME_LOG_IMPL(LOG_WARNING, fmt __VA_OPT__(, ) __VA_ARGS__)

/// @brief Log an error message.
#define GEOTIME_LOG_ERROR(fmt, ...) \
    GEOTIME_LOG_IMPL(LOG_ERROR, fmt __VA_OPT__(, ) __VA_ARGS__)

/// @brief Log a critical message.
#define GEOTIME_LOG_CRITICAL(fmt, ...) \
    GEOTIME_LOG_IMPL(LOG_CRITICAL, fmt __VA_OPT__(, ) __VA_ARGS__)

#endif  // GEOTIME_COMMON_LOGGER_H
