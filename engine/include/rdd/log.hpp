// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 rdd Contributors


/**
 * @file log.hpp
 * @brief Logging interface for rdd
 *
 * The library never writes to stdout/stderr on its own. Messages are
 * dispatched to a process-wide, thread-safe handler; with no handler
 * installed the library is silent.
 *
 * Example:
 * @code
 *   rdd::set_log_handler([](rdd::LogLevel level, std::string_view msg) {
 *       std::cerr << "[" << rdd::log_level_name(level) << "] " << msg << "\n";
 *   });
 *
 *   rdd::log_emit(rdd::LogLevel::Info, "starting copy");
 *   // ... library and app logs dispatched to the handler ...
 *
 *   rdd::clear_log_handler();
 * @endcode
 */

#ifndef RDD_LOG_HPP
#define RDD_LOG_HPP

#include <functional>
#include <string_view>

namespace rdd {

/// Log severity levels (match syslog priorities 1:1)
enum class LogLevel {
    Error = 3,   ///< Error condition
    Warning = 4, ///< Warning condition
    Notice = 5,  ///< Normal but significant
    Info = 6,    ///< Informational
    Debug = 7    ///< Debug-level
};

/// Return a short name for the given log level ("ERR", "WARN", etc.)
[[nodiscard]] inline const char *log_level_name(LogLevel level) noexcept {
    switch (level) {
    case LogLevel::Error:
        return "ERR";
    case LogLevel::Warning:
        return "WARN";
    case LogLevel::Notice:
        return "NOTICE";
    case LogLevel::Info:
        return "INFO";
    case LogLevel::Debug:
        return "DEBUG";
    default:
        return "???";
    }
}

/// Log handler callback type
using LogHandler = std::function<void(LogLevel, std::string_view)>;

/// Install a process-wide log handler.
///
/// Replaces any previously installed handler.  The handler is called from
/// whichever thread emits the log message (shard workers included); it must
/// be thread-safe.
void set_log_handler(LogHandler handler);

/// Remove the current log handler.
///
/// After this call the library is silent (default state).
void clear_log_handler() noexcept;

/// True when a handler is installed.
[[nodiscard]] bool log_enabled() noexcept;

/// Emit a log message through the registered handler (if any).
///
/// No-op when no handler is installed.  Thread-safe.
void log_emit(LogLevel level, std::string_view msg);

} // namespace rdd

#endif // RDD_LOG_HPP
