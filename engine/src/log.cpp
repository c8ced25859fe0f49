// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 rdd Contributors


/**
 * @file log.cpp
 * @brief Process-wide log handler
 */

#include "log.h"

#include <atomic>
#include <cstdarg>
#include <cstdio>
#include <mutex>
#include <string>

namespace rdd {

namespace {

std::mutex log_mutex;
LogHandler log_handler_fn;

// Lets the hot path skip formatting without taking the mutex.
std::atomic<bool> log_installed{false};

constexpr std::size_t LOG_LINE_MAX = 512;

} // namespace

void set_log_handler(LogHandler handler) {
    std::lock_guard<std::mutex> lock(log_mutex);
    log_installed.store(static_cast<bool>(handler), std::memory_order_release);
    log_handler_fn = std::move(handler);
}

void clear_log_handler() noexcept {
    std::lock_guard<std::mutex> lock(log_mutex);
    log_installed.store(false, std::memory_order_release);
    log_handler_fn = nullptr;
}

bool log_enabled() noexcept {
    return log_installed.load(std::memory_order_acquire);
}

void log_emit(LogLevel level, std::string_view msg) {
    if (!log_enabled()) return;

    std::lock_guard<std::mutex> lock(log_mutex);
    if (log_handler_fn) {
        log_handler_fn(level, msg);
    }
}

namespace detail {

void log(LogLevel level, const char *fmt, ...) {
    if (!log_enabled()) return;

    char buf[LOG_LINE_MAX];
    va_list ap;
    va_start(ap, fmt);
    int n = std::vsnprintf(buf, sizeof(buf), fmt, ap);
    va_end(ap);
    if (n < 0) return;

    std::size_t len = static_cast<std::size_t>(n);
    if (len >= sizeof(buf)) len = sizeof(buf) - 1; // truncated
    log_emit(level, std::string_view(buf, len));
}

} // namespace detail

} // namespace rdd
