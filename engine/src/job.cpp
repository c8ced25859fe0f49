// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 rdd Contributors


/**
 * @file job.cpp
 * @brief JobDescriptor validation
 */

#include <rdd/digest.hpp>
#include <rdd/error.hpp>
#include <rdd/job.hpp>

#include "internal.h"

#include <string>

namespace rdd {

namespace {

/// Blocks per claim when the caller leaves it to us
constexpr std::size_t AUTO_CLAIM_BLOCKS = 8;

/// With verification, single-block claims keep the reorder window tight
constexpr std::size_t AUTO_CLAIM_BLOCKS_VERIFY = 1;

std::uint64_t to_offset(std::uint64_t blocks, std::size_t block_size, const char *what) {
    std::uint64_t bytes = 0;
    if (!detail::blocks_to_offset(blocks, block_size, bytes)) {
        throw Error(ErrorKind::Config, EOVERFLOW,
                    std::string(what) + " of " + std::to_string(blocks) + " blocks of " +
                        std::to_string(block_size) + " bytes exceeds the addressable range");
    }
    return bytes;
}

} // namespace

JobDescriptor JobDescriptor::from_options(const JobOptions &opts) {
    if (opts.block_size() == 0) {
        throw config_error("block size must be greater than 0");
    }
    if (opts.threads() < 1 || opts.threads() > MAX_THREADS) {
        throw config_error("thread count " + std::to_string(opts.threads()) +
                           " out of range (1.." + std::to_string(MAX_THREADS) + ")");
    }
    if (opts.input().empty()) {
        throw config_error("input path is empty");
    }
    if (opts.output().empty()) {
        throw config_error("output path is empty");
    }

    JobDescriptor job;
    job.input_path_ = opts.input();
    job.output_path_ = opts.output();
    job.block_size_ = opts.block_size();
    job.block_count_ = opts.count();
    job.skip_blocks_ = opts.skip();
    job.seek_blocks_ = opts.seek();
    job.thread_count_ = opts.threads();

    job.skip_bytes_ = to_offset(opts.skip(), opts.block_size(), "skip");
    job.seek_bytes_ = to_offset(opts.seek(), opts.block_size(), "seek");

    if (opts.count() > 0) {
        job.byte_limit_ = to_offset(opts.count(), opts.block_size(), "count");
        std::uint64_t end_blocks = 0;
        if (!detail::checked_add(opts.seek(), opts.count(), end_blocks)) {
            throw Error(ErrorKind::Config, EOVERFLOW, "seek + count overflows");
        }
        (void)to_offset(end_blocks, opts.block_size(), "seek + count");
        // The input end is not checked: reading past it is only an early EOF.
    }

    job.algorithm_ = opts.verify();
    if (!opts.expect_digest().empty()) {
        if (job.algorithm_ == HashAlgorithm::None) {
            throw config_error("expected digest given without a verification algorithm");
        }
        job.expected_digest_ = parse_hex_digest(opts.expect_digest(), job.algorithm_);
    }
    if (opts.readback() && job.algorithm_ == HashAlgorithm::None) {
        throw config_error("read-back verification requires a verification algorithm");
    }
    job.readback_ = opts.readback();

    job.direct_ = opts.direct();
    job.progress_ = opts.progress();
    job.progress_interval_ = std::chrono::milliseconds(opts.progress_interval_ms());
    job.backend_ = opts.backend();

    if (opts.claim_blocks() > 0) {
        job.claim_blocks_ = opts.claim_blocks();
    } else {
        job.claim_blocks_ = job.verifies() ? AUTO_CLAIM_BLOCKS_VERIFY : AUTO_CLAIM_BLOCKS;
    }
    return job;
}

} // namespace rdd
