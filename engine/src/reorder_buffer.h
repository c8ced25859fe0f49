// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 rdd Contributors


/**
 * @file reorder_buffer.h
 * @brief Bounded offset-ordered handoff from shards to the digest
 *
 * Internal header - not part of public API.
 */

#ifndef RDD_REORDER_BUFFER_H
#define RDD_REORDER_BUFFER_H

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <map>
#include <mutex>
#include <vector>

namespace rdd::detail {

/**
 * Block copy waiting for the digest
 */
struct ReorderEntry {
    std::uint64_t offset = 0;        /**< Logical offset in the copied region */
    std::vector<std::uint8_t> bytes; /**< Exactly the bytes written */
};

/**
 * Multi-producer, single-consumer reorder window
 *
 * Producers (shards) push copies of written blocks keyed by logical
 * offset, in any order. The consumer pops them strictly in ascending,
 * gap-free offset order.
 *
 * At most window_bytes ahead of next_offset() may be held. A producer
 * whose block starts at next_offset() is always admitted, so the window
 * cannot deadlock: every block below it has already been consumed.
 */
class ReorderBuffer {
  public:
    /// pop() outcome
    enum class PopStatus {
        Ready,   ///< entry holds the block at the previous next_offset()
        Timeout, ///< Nothing in order yet; producers still running
        Drained, ///< All producers done and nothing left
        Gap,     ///< All producers done but blocks are missing below held ones
        Aborted  ///< abort() was called
    };

    /**
     * @param window_bytes Bytes that may be held ahead of next_offset()
     * @param producers    Number of producers that will call producer_done()
     */
    ReorderBuffer(std::uint64_t window_bytes, unsigned producers);

    ReorderBuffer(const ReorderBuffer &) = delete;
    ReorderBuffer &operator=(const ReorderBuffer &) = delete;

    /**
     * Hand a block to the consumer (copies the bytes)
     *
     * Blocks while the offset is outside the window.
     *
     * @return False if the buffer was aborted
     */
    bool push(std::uint64_t offset, const void *data, std::size_t len);

    /// Mark one producer as finished
    void producer_done();

    /**
     * Take the next in-order block
     *
     * @param entry Receives the block on Ready
     * @param wait  Longest time to wait for it
     */
    PopStatus pop(ReorderEntry &entry, std::chrono::milliseconds wait);

    /// Return a consumed block's storage for reuse
    void recycle(std::vector<std::uint8_t> &&bytes);

    /// Wake everyone; subsequent push() and pop() fail
    void abort();

    [[nodiscard]] std::uint64_t next_offset() const;

    /// Blocks currently held
    [[nodiscard]] std::size_t pending() const;

  private:
    [[nodiscard]] bool admissible(std::uint64_t offset) const noexcept;

    mutable std::mutex lock_;
    std::condition_variable space_cv_;
    std::condition_variable data_cv_;
    std::map<std::uint64_t, std::vector<std::uint8_t>> held_;
    std::vector<std::vector<std::uint8_t>> spare_;
    std::uint64_t next_ = 0;
    const std::uint64_t window_;
    unsigned producers_left_;
    bool aborted_ = false;
};

} // namespace rdd::detail

#endif // RDD_REORDER_BUFFER_H
