// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 rdd Contributors


/**
 * @file job.hpp
 * @brief Validated description of one copy operation
 */

#ifndef RDD_JOB_HPP
#define RDD_JOB_HPP

#include <rdd/options.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace rdd {

/**
 * Immutable, validated job description
 *
 * Only obtainable through from_options(), so every instance satisfies:
 * block size > 0, 1 <= threads <= MAX_THREADS, and all block-to-byte
 * conversions fit off_t. Direct-I/O alignment is a property of the
 * device and is checked later, when endpoints are opened.
 */
class JobDescriptor {
  public:
    /**
     * Validate options into a descriptor
     *
     * Performs no I/O, so a rejected job never creates or truncates
     * the output.
     *
     * @param opts Raw options
     * @return Validated descriptor
     * @throws Error (kind Config) describing the first invalid setting
     */
    [[nodiscard]] static JobDescriptor from_options(const JobOptions &opts);

    [[nodiscard]] const std::string &input_path() const noexcept { return input_path_; }
    [[nodiscard]] const std::string &output_path() const noexcept { return output_path_; }
    [[nodiscard]] std::size_t block_size() const noexcept { return block_size_; }

    /// Block limit; 0 means "until input exhausted"
    [[nodiscard]] std::uint64_t block_count() const noexcept { return block_count_; }
    [[nodiscard]] std::uint64_t skip_blocks() const noexcept { return skip_blocks_; }
    [[nodiscard]] std::uint64_t seek_blocks() const noexcept { return seek_blocks_; }
    [[nodiscard]] unsigned thread_count() const noexcept { return thread_count_; }
    [[nodiscard]] HashAlgorithm verification_algorithm() const noexcept { return algorithm_; }
    [[nodiscard]] bool verifies() const noexcept { return algorithm_ != HashAlgorithm::None; }

    /// Decoded expected digest; empty when none was supplied
    [[nodiscard]] const std::vector<std::uint8_t> &expected_digest() const noexcept {
        return expected_digest_;
    }
    [[nodiscard]] bool readback() const noexcept { return readback_; }
    [[nodiscard]] bool use_direct_io() const noexcept { return direct_; }
    [[nodiscard]] bool progress() const noexcept { return progress_; }
    [[nodiscard]] std::chrono::milliseconds progress_interval() const noexcept {
        return progress_interval_;
    }
    [[nodiscard]] Backend backend() const noexcept { return backend_; }

    /// Blocks per range claim in the sharded engine (never 0)
    [[nodiscard]] std::size_t claim_blocks() const noexcept { return claim_blocks_; }

    /// skip_blocks x block_size
    [[nodiscard]] std::uint64_t skip_bytes() const noexcept { return skip_bytes_; }

    /// seek_blocks x block_size
    [[nodiscard]] std::uint64_t seek_bytes() const noexcept { return seek_bytes_; }

    /// block_count x block_size; 0 when unlimited
    [[nodiscard]] std::uint64_t byte_limit() const noexcept { return byte_limit_; }

  private:
    JobDescriptor() = default;

    std::string input_path_;
    std::string output_path_;
    std::size_t block_size_ = 0;
    std::uint64_t block_count_ = 0;
    std::uint64_t skip_blocks_ = 0;
    std::uint64_t seek_blocks_ = 0;
    unsigned thread_count_ = 1;
    HashAlgorithm algorithm_ = HashAlgorithm::None;
    std::vector<std::uint8_t> expected_digest_;
    bool readback_ = false;
    bool direct_ = false;
    bool progress_ = true;
    std::chrono::milliseconds progress_interval_{DEFAULT_PROGRESS_INTERVAL_MS};
    Backend backend_ = Backend::Posix;
    std::size_t claim_blocks_ = 1;
    std::uint64_t skip_bytes_ = 0;
    std::uint64_t seek_bytes_ = 0;
    std::uint64_t byte_limit_ = 0;
};

} // namespace rdd

#endif // RDD_JOB_HPP
