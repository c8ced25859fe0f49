// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 rdd Contributors


/**
 * @file engine.hpp
 * @brief Copy engines and the job entry point
 */

#ifndef RDD_ENGINE_HPP
#define RDD_ENGINE_HPP

#include <rdd/digest.hpp>
#include <rdd/fwd.hpp>
#include <rdd/job.hpp>
#include <rdd/progress.hpp>
#include <rdd/stats.hpp>

#include <memory>

namespace rdd {

/**
 * Hooks a running engine reports to
 *
 * Both pointers are optional and not owned.
 */
struct RunHooks {
    ProgressSink *progress = nullptr;  ///< Receives periodic samples
    const CancelToken *cancel = nullptr; ///< Checked before each block
};

/**
 * Copy engine interface
 *
 * An engine opens its endpoints, moves the job's block range, feeds every
 * written byte to the digest in logical order, and flushes the output.
 * It returns only after the flush succeeded.
 */
class CopyEngine {
  public:
    virtual ~CopyEngine() = default;

    CopyEngine(const CopyEngine &) = delete;
    CopyEngine &operator=(const CopyEngine &) = delete;

    /// Short engine name for logs ("single-path", "sharded")
    [[nodiscard]] virtual const char *name() const noexcept = 0;

    /**
     * Run the copy
     *
     * @param digest Receives the copied bytes in order (may be disabled)
     * @param hooks  Progress and cancellation hooks
     * @return Folded counters
     * @throws Error on failure; blocks already written are not rolled back
     */
    [[nodiscard]] virtual CopyTotals copy(Digest &digest, const RunHooks &hooks) = 0;

    [[nodiscard]] const JobDescriptor &job() const noexcept { return job_; }

  protected:
    explicit CopyEngine(const JobDescriptor &job) : job_(job) {}

  private:
    JobDescriptor job_;
};

/**
 * One-thread read, [hash], write loop
 *
 * Reuses a single block buffer. A short read produces an equally short
 * write and ends the copy.
 */
class SinglePathEngine final : public CopyEngine {
  public:
    explicit SinglePathEngine(const JobDescriptor &job) : CopyEngine(job) {}

    [[nodiscard]] const char *name() const noexcept override { return "single-path"; }
    [[nodiscard]] CopyTotals copy(Digest &digest, const RunHooks &hooks) override;
};

/**
 * Multi-threaded engine
 *
 * Each shard owns its own endpoint pair and buffer. Known-length jobs
 * without verification are split statically; otherwise shards pull block
 * ranges from a shared cursor. With verification, shards hand written
 * blocks to a bounded reorder buffer that the calling thread drains into
 * the digest in offset order.
 */
class ShardedEngine final : public CopyEngine {
  public:
    explicit ShardedEngine(const JobDescriptor &job) : CopyEngine(job) {}

    [[nodiscard]] const char *name() const noexcept override { return "sharded"; }
    [[nodiscard]] CopyTotals copy(Digest &digest, const RunHooks &hooks) override;
};

/**
 * Select the engine for a job
 * @return SinglePathEngine when thread_count is 1, else ShardedEngine
 */
[[nodiscard]] std::unique_ptr<CopyEngine> make_engine(const JobDescriptor &job);

/**
 * Execute a job
 *
 * Checks that input and output are not the same file, runs the selected
 * engine, then performs read-back and expected-digest verification.
 * A digest mismatch is reported through JobResult::verification(), not
 * thrown.
 *
 * @param job      Validated job
 * @param progress Optional progress sink (used only if job.progress())
 * @param cancel   Optional cancellation token
 * @return Result of the completed copy
 * @throws Error (Config, Io, Coordination or Cancelled)
 */
[[nodiscard]] JobResult run_job(const JobDescriptor &job, ProgressSink *progress = nullptr,
                                const CancelToken *cancel = nullptr);

} // namespace rdd

#endif // RDD_ENGINE_HPP
