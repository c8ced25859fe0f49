// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 rdd Contributors


/**
 * @file copy_common.h
 * @brief Pieces shared by the single-path and sharded engines
 *
 * Internal header - not part of public API.
 */

#ifndef RDD_COPY_COMMON_H
#define RDD_COPY_COMMON_H

#include <rdd/buffer.hpp>
#include <rdd/endpoint.hpp>
#include <rdd/engine.hpp>
#include <rdd/error.hpp>
#include <rdd/job.hpp>
#include <rdd/progress.hpp>

#include "internal.h"

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <memory>

namespace rdd::detail {

/**
 * Throw ErrorKind::Cancelled if the token has been triggered
 */
inline void check_cancel(const CancelToken *cancel) {
    if (cancel && cancel->requested()) {
        throw Error(ErrorKind::Cancelled, ECANCELED, "copy cancelled");
    }
}

/**
 * Open the job's input at a byte offset
 */
inline std::unique_ptr<Endpoint> open_job_input(const JobDescriptor &job, std::uint64_t offset) {
    EndpointOptions opts;
    opts.path = job.input_path();
    opts.mode = OpenMode::Read;
    opts.backend = job.backend();
    opts.direct = job.use_direct_io();
    opts.block_size = job.block_size();
    opts.start_offset = offset;
    return open_endpoint(opts);
}

/**
 * Open the job's output at a byte offset
 */
inline std::unique_ptr<Endpoint> open_job_output(const JobDescriptor &job, OpenMode mode,
                                                 std::uint64_t offset) {
    EndpointOptions opts;
    opts.path = job.output_path();
    opts.mode = mode;
    opts.backend = job.backend();
    opts.direct = job.use_direct_io();
    opts.block_size = job.block_size();
    opts.start_offset = offset;
    return open_endpoint(opts);
}

/**
 * Allocate a block buffer suitable for both endpoints
 */
inline Buffer allocate_block(const JobDescriptor &job, const Endpoint &in, const Endpoint &out) {
    std::size_t align = std::max({DEFAULT_BUFFER_ALIGNMENT, in.alignment(), out.alignment()});
    return Buffer::allocate(job.block_size(), align);
}

/**
 * Rate-limited progress emitter
 *
 * Lives on the coordinating thread.
 */
class ProgressMeter {
  public:
    ProgressMeter(const JobDescriptor &job, ProgressSink *sink)
        : sink_(job.progress() ? sink : nullptr),
          interval_ns_(std::chrono::duration_cast<std::chrono::nanoseconds>(
                           job.progress_interval())
                           .count()),
          byte_limit_(job.byte_limit()), start_ns_(get_time_ns()), last_ns_(start_ns_) {}

    /// Emit a sample if the interval has elapsed
    void tick(std::uint64_t bytes_done) {
        if (!sink_) return;
        std::int64_t now = get_time_ns();
        if (now - last_ns_ < interval_ns_) return;
        last_ns_ = now;
        emit(bytes_done, now, false);
    }

    /// Emit the last sample
    void finish(std::uint64_t bytes_done) {
        if (!sink_) return;
        emit(bytes_done, get_time_ns(), true);
    }

    [[nodiscard]] bool active() const noexcept { return sink_ != nullptr; }

  private:
    void emit(std::uint64_t bytes_done, std::int64_t now, bool final) {
        ProgressSample sample;
        sample.bytes_done = bytes_done;
        sample.byte_limit = byte_limit_;
        sample.elapsed = std::chrono::nanoseconds(now - start_ns_);
        sample.final = final;
        sink_->on_progress(sample);
    }

    ProgressSink *sink_;
    std::int64_t interval_ns_;
    std::uint64_t byte_limit_;
    std::int64_t start_ns_;
    std::int64_t last_ns_;
};

} // namespace rdd::detail

#endif // RDD_COPY_COMMON_H
