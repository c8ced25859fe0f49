// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 rdd Contributors


/**
 * @file rdd_syslog.cpp
 * @brief Syslog log handler integration for rdd
 */

#include "rdd_syslog.hpp"

#include <string>

#include <syslog.h>

namespace rdd {

void syslog_install(const SyslogOptions *options) {
    SyslogOptions opts;
    if (options) {
        opts = *options;
    }
    const char *ident = opts.ident ? opts.ident : "rdd";
    int facility = opts.facility >= 0 ? opts.facility : LOG_USER;
    int flags = opts.log_options >= 0 ? opts.log_options : (LOG_PID | LOG_NDELAY);
    LogLevel max_level = opts.max_level;

    openlog(ident, flags, facility);
    set_log_handler([max_level](LogLevel level, std::string_view msg) {
        if (static_cast<int>(level) > static_cast<int>(max_level)) {
            return;
        }
        std::string text(msg);
        syslog(static_cast<int>(level), "%s", text.c_str());
    });
}

void syslog_remove() noexcept {
    clear_log_handler();
    closelog();
}

} // namespace rdd
