// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 rdd Contributors


/**
 * @file progress.hpp
 * @brief Progress samples and cooperative cancellation
 */

#ifndef RDD_PROGRESS_HPP
#define RDD_PROGRESS_HPP

#include <rdd/fwd.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>

namespace rdd {

/**
 * One progress observation
 */
struct ProgressSample {
    std::uint64_t bytes_done = 0;       ///< Bytes written so far (all shards)
    std::uint64_t byte_limit = 0;       ///< Bytes requested (0 = until end of input)
    std::chrono::nanoseconds elapsed{0}; ///< Time since the copy started
    bool final = false;                 ///< Last sample of the job
};

/**
 * Progress consumer
 *
 * Called from the thread that invoked run_job(), never from a shard
 * worker, at most once per progress interval plus one final sample.
 * Exceptions thrown from on_progress() abort the job.
 */
class ProgressSink {
  public:
    virtual ~ProgressSink() = default;

    /**
     * Receive a sample
     * @param sample Current totals
     */
    virtual void on_progress(const ProgressSample &sample) = 0;
};

/**
 * Shared cancellation flag
 *
 * Engines check the flag before each block and stop with an
 * ErrorKind::Cancelled error. request() is a lock-free atomic store and
 * may be called from a signal handler.
 */
class CancelToken {
  public:
    CancelToken() noexcept = default;

    CancelToken(const CancelToken &) = delete;
    CancelToken &operator=(const CancelToken &) = delete;

    /// Ask running engines to stop at the next block boundary
    void request() noexcept { flag_.store(true, std::memory_order_relaxed); }

    /// Clear a previous request
    void reset() noexcept { flag_.store(false, std::memory_order_relaxed); }

    [[nodiscard]] bool requested() const noexcept {
        return flag_.load(std::memory_order_relaxed);
    }

  private:
    static_assert(std::atomic<bool>::is_always_lock_free);

    std::atomic<bool> flag_{false};
};

} // namespace rdd

#endif // RDD_PROGRESS_HPP
