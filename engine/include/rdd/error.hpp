// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 rdd Contributors


/**
 * @file error.hpp
 * @brief Error exception class for rdd
 */

#ifndef RDD_ERROR_HPP
#define RDD_ERROR_HPP

#include <cerrno>
#include <string>
#include <string_view>
#include <system_error>

namespace rdd {

/**
 * Failure taxonomy
 *
 * Every Error carries exactly one kind so operators can tell a device
 * problem from a bad invocation or an internal engine fault.
 */
enum class ErrorKind {
    Config,       ///< Bad size string, zero block size, misaligned direct I/O, ...
    Io,           ///< open/read/write/seek/flush failure
    Verification, ///< Digest mismatch
    Coordination, ///< Worker escaped unexpectedly, out-of-order digest update
    Cancelled     ///< Cancel token observed at a block boundary
};

/// Return a short name for the given kind ("config", "io", ...)
[[nodiscard]] inline const char *error_kind_name(ErrorKind kind) noexcept {
    switch (kind) {
    case ErrorKind::Config:
        return "config";
    case ErrorKind::Io:
        return "io";
    case ErrorKind::Verification:
        return "verification";
    case ErrorKind::Coordination:
        return "coordination";
    case ErrorKind::Cancelled:
        return "cancelled";
    default:
        return "???";
    }
}

/**
 * Exception class for rdd errors
 *
 * Inherits from std::system_error so callers can catch either
 * rdd::Error or std::system_error. Uses std::generic_category
 * for POSIX errno values.
 */
class Error : public std::system_error {
  public:
    /**
     * Construct error from errno value
     *
     * @param kind Failure class
     * @param err Error code (positive errno value)
     * @param context Optional context message
     */
    Error(ErrorKind kind, int err, std::string_view context = {})
        : std::system_error(err, std::generic_category(), std::string(context)), kind_(kind) {}

    /**
     * Construct an I/O error from errno value
     *
     * @param err Error code (positive errno value)
     * @param context Optional context message
     */
    explicit Error(int err, std::string_view context = {}) : Error(ErrorKind::Io, err, context) {}

    /**
     * Get the error code
     * @return Positive errno value
     */
    [[nodiscard]] int code() const noexcept { return std::system_error::code().value(); }

    /**
     * Get the failure class
     * @return Error kind
     */
    [[nodiscard]] ErrorKind kind() const noexcept { return kind_; }

    [[nodiscard]] bool is_config() const noexcept { return kind_ == ErrorKind::Config; }
    [[nodiscard]] bool is_io() const noexcept { return kind_ == ErrorKind::Io; }
    [[nodiscard]] bool is_verification() const noexcept {
        return kind_ == ErrorKind::Verification;
    }
    [[nodiscard]] bool is_coordination() const noexcept {
        return kind_ == ErrorKind::Coordination;
    }
    [[nodiscard]] bool is_cancelled() const noexcept { return kind_ == ErrorKind::Cancelled; }

    // Convenience predicates
    [[nodiscard]] bool is_invalid() const noexcept { return code() == EINVAL; }
    [[nodiscard]] bool is_not_found() const noexcept { return code() == ENOENT; }
    [[nodiscard]] bool is_no_space() const noexcept { return code() == ENOSPC; }
    [[nodiscard]] bool is_overflow() const noexcept { return code() == EOVERFLOW; }

  private:
    ErrorKind kind_;
};

/**
 * Build a configuration error
 *
 * @param context Description of the offending setting
 * @return Error of kind Config (EINVAL)
 */
[[nodiscard]] inline Error config_error(std::string_view context) {
    return Error(ErrorKind::Config, EINVAL, context);
}

/**
 * Throw Error if condition is false
 *
 * @param condition Condition to check
 * @param context Error context message
 * @throws Error (kind Io) with current errno if condition is false
 */
inline void check(bool condition, std::string_view context = {}) {
    if (!condition) {
        throw Error(errno, context);
    }
}

/**
 * Throw Error from current errno
 *
 * @param context Error context message
 * @throws Error (kind Io) with current errno
 */
[[noreturn]] inline void throw_errno(std::string_view context = {}) {
    throw Error(errno, context);
}

} // namespace rdd

#endif // RDD_ERROR_HPP
