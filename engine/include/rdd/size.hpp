// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 rdd Contributors


/**
 * @file size.hpp
 * @brief Human-readable size strings ("512k", "4M", "2G")
 */

#ifndef RDD_SIZE_HPP
#define RDD_SIZE_HPP

#include <rdd/error.hpp>

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace rdd {

/// Why a size string was rejected
enum class SizeError {
    Empty,              ///< Blank after trimming
    InvalidNumber,      ///< Numeric part missing or not representable in 64 bits
    UnknownSuffix,      ///< Suffix not in {k, kb, m, mb, g, gb, t, tb}
    Overflow,           ///< number x multiplier exceeds 64 bits
    ExceedsAddressSpace ///< Fits 64 bits but not size_t on this platform
};

/// Return a short description of the cause
[[nodiscard]] const char *size_error_name(SizeError cause) noexcept;

/**
 * Size parse failure
 *
 * Always a configuration-class Error; additionally carries the cause.
 */
class SizeParseError : public Error {
  public:
    SizeParseError(SizeError cause, std::string_view context)
        : Error(ErrorKind::Config, errno_for(cause), context), cause_(cause) {}

    [[nodiscard]] SizeError cause() const noexcept { return cause_; }

  private:
    // EOVERFLOW only for range failures, EINVAL for malformed input
    static int errno_for(SizeError cause) noexcept {
        return (cause == SizeError::Overflow || cause == SizeError::ExceedsAddressSpace)
                   ? EOVERFLOW
                   : EINVAL;
    }

    SizeError cause_;
};

/**
 * Parse a size string into a byte count
 *
 * Accepts `<digits><suffix>` with surrounding whitespace and any letter
 * case. Suffixes are binary: k=1024, m=1024^2, g=1024^3, t=1024^4, each
 * optionally followed by "b". No suffix means bytes.
 *
 * @param text Size string
 * @return Byte count
 * @throws SizeParseError on any malformed or out-of-range input
 */
[[nodiscard]] std::size_t parse_size(std::string_view text);

/**
 * Parse a plain non-negative decimal count (block counts, offsets)
 *
 * @param text Digits, surrounding whitespace allowed
 * @param what Name used in the error message
 * @throws SizeParseError on malformed input or 64-bit overflow
 */
[[nodiscard]] std::uint64_t parse_count(std::string_view text, std::string_view what);

/// Format a byte count for humans ("1.5 MiB", "512 B")
[[nodiscard]] std::string format_bytes(double bytes);

/// Format a rate for humans ("120.3 MiB/s")
[[nodiscard]] std::string format_rate(double bytes_per_sec);

} // namespace rdd

#endif // RDD_SIZE_HPP
