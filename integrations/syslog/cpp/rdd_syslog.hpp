// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 rdd Contributors


/**
 * @file rdd_syslog.hpp
 * @brief Syslog log handler integration for rdd
 *
 * Forwards rdd library log messages to syslog(3).
 * Standalone module: depends only on <rdd/log.hpp> and libc.
 *
 * rdd log levels map directly to syslog priorities:
 *   LogLevel::Error   (3) -> LOG_ERR     (3)
 *   LogLevel::Warning (4) -> LOG_WARNING (4)
 *   LogLevel::Notice  (5) -> LOG_NOTICE  (5)
 *   LogLevel::Info    (6) -> LOG_INFO    (6)
 *   LogLevel::Debug   (7) -> LOG_DEBUG   (7)
 *
 * Usage:
 * @code
 *   rdd::syslog_install();   // defaults: ident="rdd", LOG_USER
 *   auto result = rdd::run_job(job);
 *   rdd::syslog_remove();
 * @endcode
 */

#ifndef RDD_SYSLOG_HPP
#define RDD_SYSLOG_HPP

#include <rdd/log.hpp>

namespace rdd {

/**
 * Syslog configuration options
 *
 * A value of -1 means "use default" for numeric fields.
 */
struct SyslogOptions {
    const char *ident = "rdd"; ///< openlog ident; must outlive syslog_remove()
    int facility = -1;         ///< Syslog facility (default: LOG_USER)
    int log_options = -1;      ///< openlog() flags (default: LOG_PID | LOG_NDELAY)
    LogLevel max_level = LogLevel::Info; ///< Messages above this level are dropped
};

/**
 * Install a syslog-forwarding log handler
 *
 * Calls openlog() then registers a log handler that calls syslog().
 * Replaces any previously installed handler.
 *
 * @param options Configuration (nullptr for defaults)
 */
void syslog_install(const SyslogOptions *options = nullptr);

/**
 * Remove the log handler and close syslog
 */
void syslog_remove() noexcept;

} // namespace rdd

#endif // RDD_SYSLOG_HPP
