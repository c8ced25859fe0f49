// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 rdd Contributors


/**
 * @file stats.hpp
 * @brief Copy counters and job result
 */

#ifndef RDD_STATS_HPP
#define RDD_STATS_HPP

#include <rdd/digest.hpp>
#include <rdd/fwd.hpp>
#include <rdd/options.hpp>

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace rdd {

namespace detail {
class JobRunner;
}

/// Outcome of the verification step
enum class VerificationStatus {
    NotRequested, ///< No algorithm configured
    Computed,     ///< Digest computed, nothing to compare against
    Matched,      ///< Digest equals the expected and/or read-back digest
    Mismatch      ///< Digest differs; the copy itself completed
};

/// "not requested", "computed", "matched", "mismatch"
[[nodiscard]] const char *verification_status_name(VerificationStatus status) noexcept;

/**
 * Raw counters produced by a copy engine
 *
 * Folded across shards in index order.
 */
struct CopyTotals {
    std::uint64_t full_blocks = 0;    ///< Blocks transferred at full block size
    std::uint64_t partial_blocks = 0; ///< Short blocks (end of input)
    std::uint64_t bytes = 0;          ///< Bytes written
    unsigned shards = 1;              ///< Workers that ran

    CopyTotals &operator+=(const CopyTotals &other) noexcept {
        full_blocks += other.full_blocks;
        partial_blocks += other.partial_blocks;
        bytes += other.bytes;
        return *this;
    }
};

/**
 * Result of a completed job
 *
 * Produced by run_job(). Copy counters are valid even when verification
 * reports a mismatch.
 */
class JobResult {
  public:
    /**
     * Get blocks copied
     * @return Full plus partial blocks
     */
    [[nodiscard]] std::uint64_t blocks_copied() const noexcept {
        return totals_.full_blocks + totals_.partial_blocks;
    }

    /**
     * Get full blocks copied
     * @return Blocks of exactly block_size bytes ("N" in dd's N+M records)
     */
    [[nodiscard]] std::uint64_t full_blocks() const noexcept { return totals_.full_blocks; }

    /**
     * Get partial blocks copied
     * @return Short blocks ("M" in dd's N+M records)
     */
    [[nodiscard]] std::uint64_t partial_blocks() const noexcept { return totals_.partial_blocks; }

    /**
     * Get bytes copied
     * @return Bytes written to the output
     */
    [[nodiscard]] std::uint64_t bytes_copied() const noexcept { return totals_.bytes; }

    /**
     * Get wall-clock duration of the copy (open through flush)
     * @return Elapsed time
     */
    [[nodiscard]] std::chrono::nanoseconds elapsed() const noexcept { return elapsed_; }

    /**
     * Get average throughput
     * @return Bytes per second (0 if elapsed is 0)
     */
    [[nodiscard]] double throughput_bps() const noexcept {
        double secs = std::chrono::duration<double>(elapsed_).count();
        return secs > 0 ? static_cast<double>(totals_.bytes) / secs : 0.0;
    }

    /// Number of workers that ran (1 for the single-path engine)
    [[nodiscard]] unsigned shards() const noexcept { return totals_.shards; }

    [[nodiscard]] HashAlgorithm algorithm() const noexcept { return algorithm_; }

    /**
     * Get streamed digest of the copied region
     * @return Lowercase hex, or nullopt when verification was not requested
     */
    [[nodiscard]] std::optional<std::string> digest() const {
        if (digest_.empty()) return std::nullopt;
        return to_hex(digest_);
    }

    [[nodiscard]] const DigestBytes &digest_bytes() const noexcept { return digest_; }

    [[nodiscard]] VerificationStatus verification() const noexcept { return status_; }

    /// Expected digest (lowercase hex), if one was supplied
    [[nodiscard]] std::optional<std::string> expected_digest() const {
        if (expected_.empty()) return std::nullopt;
        return to_hex(expected_);
    }

    /// Digest of the output re-read after the flush, if read-back ran
    [[nodiscard]] std::optional<std::string> readback_digest() const {
        if (readback_.empty()) return std::nullopt;
        return to_hex(readback_);
    }

    /**
     * Convert a verification mismatch into an exception
     * @throws Error (kind Verification) if verification() is Mismatch
     */
    void throw_if_mismatch() const;

  private:
    friend class detail::JobRunner;

    JobResult() = default;

    CopyTotals totals_;
    std::chrono::nanoseconds elapsed_{0};
    HashAlgorithm algorithm_ = HashAlgorithm::None;
    DigestBytes digest_;
    DigestBytes expected_;
    DigestBytes readback_;
    VerificationStatus status_ = VerificationStatus::NotRequested;
};

} // namespace rdd

#endif // RDD_STATS_HPP
