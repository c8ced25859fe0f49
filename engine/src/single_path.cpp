// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 rdd Contributors


/**
 * @file single_path.cpp
 * @brief One-thread copy loop
 */

#include <rdd/engine.hpp>

#include "copy_common.h"
#include "log.h"

namespace rdd {

CopyTotals SinglePathEngine::copy(Digest &digest, const RunHooks &hooks) {
    const JobDescriptor &j = job();
    detail::ProgressMeter meter(j, hooks.progress);

    // Opening: the input first, so a bad input never creates the output.
    auto input = detail::open_job_input(j, j.skip_bytes());
    auto output = detail::open_job_output(j, OpenMode::CreateTruncate, j.seek_bytes());
    auto buffer = detail::allocate_block(j, *input, *output);

    CopyTotals totals;
    const std::size_t bs = j.block_size();

    for (;;) {
        if (j.block_count() > 0 && totals.full_blocks + totals.partial_blocks >= j.block_count()) {
            break;
        }
        detail::check_cancel(hooks.cancel);

        std::size_t n = input->read(buffer.data(), bs);
        if (n == 0) {
            RDD_LOG_DEBUG("end of input at offset %llu",
                          (unsigned long long)input->position());
            break;
        }

        // Only the bytes actually read; never the stale tail of the buffer.
        output->write(buffer.data(), n);
        digest.update(totals.bytes, buffer.data(), n);
        totals.bytes += n;

        if (n == bs) {
            totals.full_blocks++;
        } else {
            totals.partial_blocks++;
        }
        meter.tick(totals.bytes);

        if (n < bs) {
            RDD_LOG_DEBUG("short read of %zu bytes; end of input", n);
            break;
        }
    }

    RDD_LOG_DEBUG("flushing '%s'", output->path().c_str());
    output->flush();
    meter.finish(totals.bytes);
    return totals;
}

} // namespace rdd
