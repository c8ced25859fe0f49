// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 rdd Contributors


/**
 * @file log.h
 * @brief Internal logging infrastructure
 *
 * printf-style front end over the public handler API in <rdd/log.hpp>.
 * Formatting is skipped entirely when no handler is installed.
 */

#ifndef RDD_SRC_LOG_H
#define RDD_SRC_LOG_H

#include <rdd/log.hpp>

namespace rdd::detail {

/**
 * Emit a log message through the registered handler (if any).
 *
 * No-op when no handler is registered.
 */
void log(LogLevel level, const char *fmt, ...) __attribute__((format(printf, 2, 3)));

} // namespace rdd::detail

#define RDD_LOG_ERR(...) ::rdd::detail::log(::rdd::LogLevel::Error, __VA_ARGS__)
#define RDD_LOG_WARN(...) ::rdd::detail::log(::rdd::LogLevel::Warning, __VA_ARGS__)
#define RDD_LOG_NOTICE(...) ::rdd::detail::log(::rdd::LogLevel::Notice, __VA_ARGS__)
#define RDD_LOG_INFO(...) ::rdd::detail::log(::rdd::LogLevel::Info, __VA_ARGS__)
#define RDD_LOG_DEBUG(...) ::rdd::detail::log(::rdd::LogLevel::Debug, __VA_ARGS__)

#endif // RDD_SRC_LOG_H
