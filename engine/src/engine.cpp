// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 rdd Contributors


/**
 * @file engine.cpp
 * @brief Engine selection and job execution
 */

#include <rdd/engine.hpp>
#include <rdd/error.hpp>

#include "copy_common.h"
#include "internal.h"
#include "log.h"

#include <cerrno>
#include <string>

#include <sys/stat.h>

namespace rdd {

const char *verification_status_name(VerificationStatus status) noexcept {
    switch (status) {
    case VerificationStatus::NotRequested:
        return "not requested";
    case VerificationStatus::Computed:
        return "computed";
    case VerificationStatus::Matched:
        return "matched";
    case VerificationStatus::Mismatch:
        return "mismatch";
    default:
        return "???";
    }
}

void JobResult::throw_if_mismatch() const {
    if (status_ != VerificationStatus::Mismatch) {
        return;
    }
    std::string msg = std::string(hash_algorithm_name(algorithm_)) + " mismatch: copied " +
                      to_hex(digest_);
    if (!expected_.empty()) msg += ", expected " + to_hex(expected_);
    if (!readback_.empty()) msg += ", read back " + to_hex(readback_);
    throw Error(ErrorKind::Verification, EIO, msg);
}

std::unique_ptr<CopyEngine> make_engine(const JobDescriptor &job) {
    if (job.thread_count() > 1) {
        return std::make_unique<ShardedEngine>(job);
    }
    return std::make_unique<SinglePathEngine>(job);
}

namespace detail {

/**
 * Drives one job: safety checks, engine, verification
 */
class JobRunner {
  public:
    JobRunner(const JobDescriptor &job, ProgressSink *progress, const CancelToken *cancel)
        : job_(job), hooks_{progress, cancel} {}

    JobResult run() {
        reject_same_file();

        auto engine = make_engine(job_);
        RDD_LOG_INFO("copy '%s' -> '%s': bs=%zu count=%llu skip=%llu seek=%llu threads=%u "
                     "backend=%s verify=%s%s engine=%s",
                     job_.input_path().c_str(), job_.output_path().c_str(), job_.block_size(),
                     (unsigned long long)job_.block_count(),
                     (unsigned long long)job_.skip_blocks(),
                     (unsigned long long)job_.seek_blocks(), job_.thread_count(),
                     backend_name(job_.backend()),
                     hash_algorithm_name(job_.verification_algorithm()),
                     job_.use_direct_io() ? " direct" : "", engine->name());

        JobResult result;
        result.algorithm_ = job_.verification_algorithm();
        Digest digest(job_.verification_algorithm());

        std::int64_t start = get_time_ns();
        try {
            result.totals_ = engine->copy(digest, hooks_);
        } catch (const Error &e) {
            RDD_LOG_ERR("copy failed (%s): %s", error_kind_name(e.kind()), e.what());
            throw;
        }
        result.elapsed_ = std::chrono::nanoseconds(get_time_ns() - start);

        RDD_LOG_INFO("copied %llu+%llu blocks, %llu bytes in %.3f s",
                     (unsigned long long)result.totals_.full_blocks,
                     (unsigned long long)result.totals_.partial_blocks,
                     (unsigned long long)result.totals_.bytes,
                     std::chrono::duration<double>(result.elapsed_).count());

        if (digest.enabled()) {
            result.digest_ = digest.finalize();
            verify(result);
        }
        return result;
    }

  private:
    /// Input and output naming the same inode would overwrite the source
    void reject_same_file() const {
        struct stat in_st;
        if (::stat(job_.input_path().c_str(), &in_st) != 0) {
            // Open reports the real error with its own context.
            return;
        }
        struct stat out_st;
        if (::stat(job_.output_path().c_str(), &out_st) != 0) {
            return; // output does not exist yet
        }
        if (in_st.st_dev == out_st.st_dev && in_st.st_ino == out_st.st_ino) {
            throw config_error("input '" + job_.input_path() + "' and output '" +
                               job_.output_path() + "' are the same file");
        }
    }

    void verify(JobResult &result) const {
        bool compared = false;
        bool matched = true;

        if (!job_.expected_digest().empty()) {
            result.expected_ = job_.expected_digest();
            compared = true;
            matched = digest_equal(result.digest_, result.expected_) && matched;
        }

        if (job_.readback()) {
            result.readback_ = read_back(result.totals_.bytes);
            compared = true;
            matched = digest_equal(result.digest_, result.readback_) && matched;
        }

        if (!compared) {
            result.status_ = VerificationStatus::Computed;
        } else if (matched) {
            result.status_ = VerificationStatus::Matched;
        } else {
            result.status_ = VerificationStatus::Mismatch;
            RDD_LOG_WARN("%s verification mismatch for '%s'",
                         hash_algorithm_name(result.algorithm_), job_.output_path().c_str());
        }
    }

    DigestBytes read_back(std::uint64_t bytes) const {
        EndpointOptions opts;
        opts.path = job_.output_path();
        opts.mode = OpenMode::Read;
        opts.backend = job_.backend();
        opts.direct = job_.use_direct_io();
        opts.block_size = job_.block_size();
        auto endpoint = open_endpoint(opts);

        RDD_LOG_INFO("reading back %llu bytes of '%s'", (unsigned long long)bytes,
                     job_.output_path().c_str());
        if (bytes == 0) {
            // hash_range treats length 0 as "to end"; an empty copy hashes nothing.
            return Digest(job_.verification_algorithm()).finalize();
        }
        std::uint64_t hashed = 0;
        DigestBytes out = hash_range(*endpoint, job_.seek_bytes(), bytes,
                                     job_.verification_algorithm(), job_.block_size(), &hashed);
        if (hashed != bytes) {
            RDD_LOG_WARN("read-back of '%s' returned %llu of %llu bytes",
                         job_.output_path().c_str(), (unsigned long long)hashed,
                         (unsigned long long)bytes);
        }
        return out;
    }

    const JobDescriptor &job_;
    RunHooks hooks_;
};

} // namespace detail

JobResult run_job(const JobDescriptor &job, ProgressSink *progress, const CancelToken *cancel) {
    return detail::JobRunner(job, progress, cancel).run();
}

} // namespace rdd
