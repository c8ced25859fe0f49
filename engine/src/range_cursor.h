// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 rdd Contributors


/**
 * @file range_cursor.h
 * @brief Block range planning for the sharded engine
 *
 * Internal header - not part of public API.
 */

#ifndef RDD_RANGE_CURSOR_H
#define RDD_RANGE_CURSOR_H

#include <cstddef>
#include <cstdint>
#include <limits>
#include <mutex>
#include <optional>
#include <vector>

namespace rdd::detail {

/** Contiguous run of blocks, relative to the start of the copied region */
struct BlockRange {
    std::uint64_t first = 0; /**< First block index */
    std::uint64_t count = 0; /**< Number of blocks */

    [[nodiscard]] std::uint64_t end() const noexcept { return first + count; }
};

/**
 * Split a known block count into contiguous shards
 *
 * Produces min(shards, total) ranges of total / n blocks each; the last
 * range also takes the remainder.
 *
 * @param total  Blocks to copy (> 0)
 * @param shards Requested shard count (> 0)
 * @return Ranges in ascending order, covering [0, total) exactly once
 */
[[nodiscard]] std::vector<BlockRange> partition_blocks(std::uint64_t total, unsigned shards);

/**
 * Shared "next available range" ticket dispenser
 *
 * Ranges are handed out in ascending order and never overlap. The upper
 * bound starts at the block limit (or unbounded) and shrinks when a
 * worker reports end of input.
 */
class RangeCursor {
  public:
    /**
     * @param limit_blocks Block limit (0 = until end of input)
     * @param claim_blocks Blocks per claim (> 0)
     */
    RangeCursor(std::uint64_t limit_blocks, std::size_t claim_blocks) noexcept;

    RangeCursor(const RangeCursor &) = delete;
    RangeCursor &operator=(const RangeCursor &) = delete;

    /**
     * Claim the next range
     * @return Range, or nullopt when the cursor is exhausted
     */
    [[nodiscard]] std::optional<BlockRange> claim();

    /**
     * Record that no data exists at or beyond a block index
     *
     * Later claims stop at the lowest index ever reported.
     */
    void report_eof(std::uint64_t block) noexcept;

    /// Current upper bound (max uint64 while unbounded)
    [[nodiscard]] std::uint64_t end() const;

    /// Ranges handed out so far
    [[nodiscard]] std::uint64_t claims() const;

  private:
    static constexpr std::uint64_t UNBOUNDED = std::numeric_limits<std::uint64_t>::max();

    mutable std::mutex lock_;
    std::uint64_t next_ = 0;
    std::uint64_t end_;
    std::uint64_t claims_ = 0;
    const std::size_t claim_blocks_;
};

} // namespace rdd::detail

#endif // RDD_RANGE_CURSOR_H
