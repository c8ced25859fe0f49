// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 rdd Contributors


/**
 * @file internal.h
 * @brief Shared internal utilities
 *
 * Internal header - not part of public API.
 * Common utilities used across multiple internal modules.
 */

#ifndef RDD_INTERNAL_H
#define RDD_INTERNAL_H

#include <cstdint>
#include <ctime>
#include <limits>
#include <sys/types.h>

namespace rdd::detail {

/// Largest byte offset representable by off_t on this platform.
inline constexpr std::uint64_t MAX_OFFSET =
    static_cast<std::uint64_t>(std::numeric_limits<off_t>::max());

/**
 * Get monotonic time in nanoseconds.
 *
 * Uses CLOCK_MONOTONIC for consistent timing that is immune to
 * system clock adjustments.
 *
 * @return Current time in nanoseconds
 */
inline std::int64_t get_time_ns() noexcept {
    struct timespec ts;
    if (clock_gettime(CLOCK_MONOTONIC, &ts) != 0) {
        return 0; // Should never happen for CLOCK_MONOTONIC on Linux
    }
    return static_cast<std::int64_t>(ts.tv_sec) * 1000000000LL + ts.tv_nsec;
}

/// a * b into out; false on 64-bit overflow (out unspecified)
inline bool checked_mul(std::uint64_t a, std::uint64_t b, std::uint64_t &out) noexcept {
    return !__builtin_mul_overflow(a, b, &out);
}

/// a + b into out; false on 64-bit overflow (out unspecified)
inline bool checked_add(std::uint64_t a, std::uint64_t b, std::uint64_t &out) noexcept {
    return !__builtin_add_overflow(a, b, &out);
}

/**
 * Convert a block index into a byte offset.
 *
 * @param blocks     Block index or count
 * @param block_size Block size in bytes
 * @param out        Resulting byte offset
 * @return False if the product overflows 64 bits or exceeds off_t
 */
inline bool blocks_to_offset(std::uint64_t blocks, std::uint64_t block_size,
                             std::uint64_t &out) noexcept {
    std::uint64_t bytes = 0;
    if (!checked_mul(blocks, block_size, bytes)) return false;
    if (bytes > MAX_OFFSET) return false;
    out = bytes;
    return true;
}

} // namespace rdd::detail

#endif // RDD_INTERNAL_H
