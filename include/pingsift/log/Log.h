// SPDX-License-Identifier: BSD-2-Clause

#pragma once
/**
 * @file Log.h
 * @brief Small thread-safe logger with levels and backends (console/file).
 *
 * Usage:
 *   pingsift::Logger::init({ .level = LogLevel::INFO,
 *                            .mode  = LogMode::Console });
 *
 *   PINGSIFT_LOG_INFO("threshold %.1f ms", cfg.filter.max_roundtrip_ms);
 *
 * Levels: TRACE < DEBUG < INFO < WARN < ERROR
 * Modes : Console (stderr), File, Silent
 *
 * stdout is reserved for forwarded probe lines, so no log level ever writes
 * there.
 */

#include <atomic>
#include <cstdarg>
#include <cstdio>
#include <mutex>
#include <optional>
#include <string>

namespace pingsift {

/**
 * @brief Logging severity levels in increasing order.
 */
enum class LogLevel {
    TRACE = 0,
    DEBUG = 1,
    INFO  = 2,
    WARN  = 3,
    ERROR = 4
};

/**
 * @brief Output backends supported by the logger.
 */
enum class LogMode {
    Console,  ///< Log to stderr.
    File,     ///< Append to a configured file.
    Silent    ///< Discard all log messages.
};

/**
 * @brief Initial configuration passed to Logger::init().
 */
struct LoggerConfig {
    LogLevel level = LogLevel::INFO;      ///< Minimum severity to emit.
    LogMode  mode  = LogMode::Console;    ///< Output backend.
    std::string file_path{};              ///< Used when mode == File.
};

/**
 * @brief Map a lowercase level name ("trace" ... "error") to a LogLevel.
 * @return std::nullopt for unknown names.
 */
std::optional<LogLevel> parse_log_level(const std::string& name);

/**
 * @brief Map a lowercase mode name ("console", "file", "silent") to a LogMode.
 */
std::optional<LogMode> parse_log_mode(const std::string& name);

/**
 * @brief Process-wide leveled printf-style logger.
 *
 * The level lives in an atomic so disabled levels cost one relaxed load.
 * Emission is serialised by a mutex so lines from the main loop, the
 * heartbeat thread and the signal thread never interleave.
 */
class Logger {
public:
    /**
     * @brief Initialise the logging backend and minimum level.
     *
     * If mode == File and the file cannot be opened, falls back to Console.
     * Calling init() again reconfigures the logger.
     */
    static void init(const LoggerConfig& cfg);

    /// Override the minimum level; safe to call from any thread.
    static void set_level(LogLevel lvl);

    static LogLevel level();

    /**
     * @brief Emit a formatted log message.
     *
     * printf-style; the caller must keep the format string and arguments in
     * agreement. A trailing newline is appended when missing.
     */
    static void log(LogLevel lvl, const char* fmt, ...)
        __attribute__((format(printf, 2, 3)));

private:
    static void vlog(LogLevel lvl, const char* fmt, va_list ap);

    static const char* level_str(LogLevel lvl);

    static std::mutex mtx_;            ///< Serialises writes to the backend.
    static std::atomic<int> level_;    ///< Current minimum level as an int.
    static LogMode mode_;              ///< Current output mode.
    static FILE* file_;                ///< Owned FILE* when mode == File.
};

// -----------------------------------------------------------------------------
// Convenience macros
// -----------------------------------------------------------------------------

/**
 * @brief Check whether a level is enabled before building expensive arguments.
 */
#define PINGSIFT_LOG_ENABLED(lvl) \
    (static_cast<int>(pingsift::Logger::level()) <= static_cast<int>(pingsift::LogLevel::lvl))

#define PINGSIFT_LOG_TRACE(fmt, ...) \
    do { \
        if (PINGSIFT_LOG_ENABLED(TRACE)) { \
            pingsift::Logger::log(pingsift::LogLevel::TRACE, fmt, ##__VA_ARGS__); \
        } \
    } while (0)

#define PINGSIFT_LOG_DEBUG(fmt, ...) \
    do { \
        if (PINGSIFT_LOG_ENABLED(DEBUG)) { \
            pingsift::Logger::log(pingsift::LogLevel::DEBUG, fmt, ##__VA_ARGS__); \
        } \
    } while (0)

#define PINGSIFT_LOG_INFO(fmt, ...) \
    do { \
        if (PINGSIFT_LOG_ENABLED(INFO)) { \
            pingsift::Logger::log(pingsift::LogLevel::INFO, fmt, ##__VA_ARGS__); \
        } \
    } while (0)

#define PINGSIFT_LOG_WARN(fmt, ...) \
    do { \
        if (PINGSIFT_LOG_ENABLED(WARN)) { \
            pingsift::Logger::log(pingsift::LogLevel::WARN, fmt, ##__VA_ARGS__); \
        } \
    } while (0)

#define PINGSIFT_LOG_ERROR(fmt, ...) \
    do { \
        if (PINGSIFT_LOG_ENABLED(ERROR)) { \
            pingsift::Logger::log(pingsift::LogLevel::ERROR, fmt, ##__VA_ARGS__); \
        } \
    } while (0)

} // namespace pingsift
