// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 rdd Contributors


/**
 * @file sharded.cpp
 * @brief Multi-threaded copy engine
 */

#include <rdd/engine.hpp>

#include "copy_common.h"
#include "internal.h"
#include "log.h"
#include "range_cursor.h"
#include "reorder_buffer.h"

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <exception>
#include <limits>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace rdd {

namespace {

/** Reorder window in blocks, per shard and claimed block */
constexpr std::uint64_t REORDER_WINDOW_FACTOR = 2;

/** Coordinator wake-up period when progress is off */
constexpr std::chrono::milliseconds IDLE_POLL{DEFAULT_PROGRESS_INTERVAL_MS};

/**
 * Per-shard state
 *
 * bytes is written only by its shard and read by the coordinator;
 * totals, position and error are read only after the shard has been joined.
 */
struct alignas(64) ShardState {
    std::atomic<std::uint64_t> bytes{0};
    CopyTotals totals;
    std::uint64_t position = 0; ///< Relative offset of the block in progress
    std::exception_ptr error;
};

/**
 * Countdown of running shards
 */
class Completion {
  public:
    explicit Completion(unsigned count) : remaining_(count) {}

    void finish() {
        {
            std::lock_guard<std::mutex> guard(lock_);
            remaining_--;
        }
        cv_.notify_all();
    }

    /// @return True once every shard has finished
    bool wait_for(std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> guard(lock_);
        return cv_.wait_for(guard, timeout, [this] { return remaining_ == 0; });
    }

  private:
    std::mutex lock_;
    std::condition_variable cv_;
    unsigned remaining_;
};

/**
 * Everything a shard needs; shared, read-only except where noted
 */
struct ShardContext {
    const JobDescriptor &job;
    detail::RangeCursor &cursor;           // claimed ranges (when no fixed plan)
    const std::vector<detail::BlockRange> &plan; // fixed plan (may be empty)
    detail::ReorderBuffer *reorder;        // set when verifying
    const std::atomic<bool> &abort;
    const CancelToken *cancel;
};

/**
 * Copy one shard's blocks
 *
 * Returns normally on completion, end of input, or when another shard
 * has failed; throws on its own failure.
 */
void run_shard(const ShardContext &ctx, unsigned index, ShardState &state) {
    const JobDescriptor &j = ctx.job;
    auto input = detail::open_job_input(j, j.skip_bytes());
    auto output = detail::open_job_output(j, OpenMode::WriteExisting, j.seek_bytes());
    auto buffer = detail::allocate_block(j, *input, *output);
    const std::size_t bs = j.block_size();
    bool fixed_taken = false;

    for (;;) {
        std::optional<detail::BlockRange> range;
        if (!ctx.plan.empty()) {
            if (fixed_taken) break;
            range = ctx.plan[index];
            fixed_taken = true;
        } else {
            range = ctx.cursor.claim();
            if (!range) break;
        }

        bool eof = false;
        for (std::uint64_t b = range->first; b < range->end(); b++) {
            if (ctx.abort.load(std::memory_order_relaxed)) {
                return;
            }
            detail::check_cancel(ctx.cancel);

            std::uint64_t rel = 0;
            if (!detail::blocks_to_offset(b, bs, rel)) {
                throw Error(EOVERFLOW, "block " + std::to_string(b) + " beyond addressable range");
            }
            state.position = rel;
            std::size_t n = input->read_at(buffer.data(), bs, j.skip_bytes() + rel);
            if (n == 0) {
                ctx.cursor.report_eof(b);
                eof = true;
                break;
            }
            output->write_at(buffer.data(), n, j.seek_bytes() + rel);
            if (ctx.reorder && !ctx.reorder->push(rel, buffer.data(), n)) {
                return;
            }

            state.totals.bytes += n;
            if (n == bs) {
                state.totals.full_blocks++;
            } else {
                state.totals.partial_blocks++;
            }
            state.bytes.store(state.totals.bytes, std::memory_order_relaxed);

            if (n < bs) {
                ctx.cursor.report_eof(b + 1);
                eof = true;
                break;
            }
        }
        if (eof) {
            RDD_LOG_DEBUG("shard %u: end of input", index);
            break;
        }
    }
    RDD_LOG_DEBUG("shard %u: %llu+%llu blocks, %llu bytes", index,
                  (unsigned long long)state.totals.full_blocks,
                  (unsigned long long)state.totals.partial_blocks,
                  (unsigned long long)state.totals.bytes);
}

std::uint64_t window_bytes(const JobDescriptor &job, unsigned shards) {
    std::uint64_t blocks = 0;
    std::uint64_t bytes = 0;
    if (!detail::checked_mul(REORDER_WINDOW_FACTOR * shards, job.claim_blocks(), blocks) ||
        !detail::checked_mul(blocks, job.block_size(), bytes)) {
        return std::numeric_limits<std::uint64_t>::max();
    }
    return bytes;
}

} // namespace

CopyTotals ShardedEngine::copy(Digest &digest, const RunHooks &hooks) {
    const JobDescriptor &j = job();
    detail::ProgressMeter meter(j, hooks.progress);
    const bool ordered = digest.enabled();

    // Input is validated before the output is created or truncated.
    {
        auto probe = detail::open_job_input(j, j.skip_bytes());
    }
    auto output = detail::open_job_output(j, OpenMode::CreateTruncate, j.seek_bytes());

    std::vector<detail::BlockRange> plan;
    unsigned shard_count = j.thread_count();
    if (j.block_count() > 0 && !ordered) {
        plan = detail::partition_blocks(j.block_count(), j.thread_count());
        shard_count = static_cast<unsigned>(plan.size());
        RDD_LOG_INFO("sharded: %u static ranges of ~%llu blocks", shard_count,
                     (unsigned long long)plan.front().count);
    } else {
        if (j.block_count() > 0) {
            shard_count = static_cast<unsigned>(
                std::min<std::uint64_t>(j.thread_count(), j.block_count()));
        }
        RDD_LOG_INFO("sharded: %u workers claiming %zu blocks at a time%s", shard_count,
                     j.claim_blocks(), ordered ? ", ordered digest" : "");
    }

    detail::RangeCursor cursor(j.block_count(), j.claim_blocks());
    std::optional<detail::ReorderBuffer> reorder;
    if (ordered) {
        reorder.emplace(window_bytes(j, shard_count), shard_count);
    }
    std::vector<ShardState> shards(shard_count);
    std::atomic<bool> abort{false};
    Completion completion(shard_count);

    ShardContext ctx{j, cursor, plan, reorder ? &*reorder : nullptr, abort, hooks.cancel};

    auto worker = [&](unsigned index) {
        ShardState &state = shards[index];
        try {
            run_shard(ctx, index, state);
        } catch (const Error &) {
            state.error = std::current_exception();
        } catch (const std::exception &e) {
            state.error = std::make_exception_ptr(
                Error(ErrorKind::Coordination, EIO,
                      "shard " + std::to_string(index) + " failed unexpectedly: " + e.what()));
        } catch (...) {
            state.error = std::make_exception_ptr(
                Error(ErrorKind::Coordination, EIO,
                      "shard " + std::to_string(index) + " failed with an unknown exception"));
        }
        if (state.error) {
            abort.store(true, std::memory_order_relaxed);
            if (ctx.reorder) ctx.reorder->abort();
        }
        if (ctx.reorder) ctx.reorder->producer_done();
        completion.finish();
    };

    auto bytes_done = [&] {
        std::uint64_t sum = 0;
        for (const auto &s : shards) {
            sum += s.bytes.load(std::memory_order_relaxed);
        }
        return sum;
    };

    const std::chrono::milliseconds poll =
        (meter.active() && j.progress_interval().count() > 0) ? j.progress_interval()
                                                              : IDLE_POLL;

    std::vector<std::thread> threads;
    threads.reserve(shard_count);
    auto stop_and_join = [&] {
        abort.store(true, std::memory_order_relaxed);
        if (reorder) reorder->abort();
        for (auto &t : threads) {
            if (t.joinable()) t.join();
        }
    };

    try {
        for (unsigned i = 0; i < shard_count; i++) {
            threads.emplace_back(worker, i);
        }

        if (reorder) {
            detail::ReorderEntry entry;
            bool draining = true;
            while (draining) {
                switch (reorder->pop(entry, poll)) {
                case detail::ReorderBuffer::PopStatus::Ready:
                    digest.update(entry.offset, entry.bytes.data(), entry.bytes.size());
                    reorder->recycle(std::move(entry.bytes));
                    meter.tick(bytes_done());
                    break;
                case detail::ReorderBuffer::PopStatus::Timeout:
                    meter.tick(bytes_done());
                    break;
                case detail::ReorderBuffer::PopStatus::Gap:
                    throw Error(ErrorKind::Coordination, EIO,
                                "verification stream has a gap at offset " +
                                    std::to_string(reorder->next_offset()));
                case detail::ReorderBuffer::PopStatus::Drained:
                case detail::ReorderBuffer::PopStatus::Aborted:
                    draining = false;
                    break;
                }
            }
        } else {
            while (!completion.wait_for(poll)) {
                meter.tick(bytes_done());
            }
        }
    } catch (...) {
        stop_and_join();
        throw;
    }

    for (auto &t : threads) {
        t.join();
    }

    // The failure at the lowest offset wins; ties go to the lower shard index.
    std::optional<unsigned> failed;
    for (unsigned i = 0; i < shard_count; i++) {
        if (shards[i].error && (!failed || shards[i].position < shards[*failed].position)) {
            failed = i;
        }
    }
    if (failed) {
        RDD_LOG_ERR("shard %u of %u failed at offset %llu", *failed, shard_count,
                    (unsigned long long)shards[*failed].position);
        std::rethrow_exception(shards[*failed].error);
    }

    CopyTotals totals;
    for (const auto &s : shards) {
        totals += s.totals;
    }
    totals.shards = shard_count;

    if (ordered && digest.next_offset() != totals.bytes) {
        throw Error(ErrorKind::Coordination, EIO,
                    "digest covered " + std::to_string(digest.next_offset()) + " of " +
                        std::to_string(totals.bytes) + " copied bytes");
    }

    RDD_LOG_DEBUG("flushing '%s'", output->path().c_str());
    output->flush();
    meter.finish(totals.bytes);
    return totals;
}

} // namespace rdd
