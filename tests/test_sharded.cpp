// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 rdd Contributors


/**
 * @file test_sharded.cpp
 * @brief End-to-end tests for the multi-threaded copy engine
 *
 * Every sharded copy must produce the same output bytes, totals and
 * digest as a single-path copy of the same job.
 */

#include "test_harness.hpp"

#include <algorithm>
#include <csignal>
#include <optional>

#include <sys/resource.h>

static rdd::JobResult run_copy(const rdd::JobOptions &opts, rdd::ProgressSink *sink = nullptr,
                               const rdd::CancelToken *cancel = nullptr) {
    return rdd::run_job(rdd::JobDescriptor::from_options(opts), sink, cancel);
}

/**
 * Run a job single-path and sharded; compare output, totals and digest
 */
static void check_equivalent(const std::string &input, rdd::JobOptions opts, unsigned threads) {
    TempDir dir;
    auto single_out = dir.path("single");
    auto sharded_out = dir.path("sharded");

    auto single = run_copy(rdd::JobOptions(opts).input(input).output(single_out).threads(1));
    auto sharded =
        run_copy(rdd::JobOptions(opts).input(input).output(sharded_out).threads(threads));

    ASSERT(read_file(single_out) == read_file(sharded_out));
    ASSERT_EQ(sharded.full_blocks(), single.full_blocks());
    ASSERT_EQ(sharded.partial_blocks(), single.partial_blocks());
    ASSERT_EQ(sharded.bytes_copied(), single.bytes_copied());
    ASSERT(sharded.digest() == single.digest());
    ASSERT(sharded.verification() == single.verification());
}

class CountingSink : public rdd::ProgressSink {
  public:
    void on_progress(const rdd::ProgressSample &sample) override {
        calls++;
        last = sample;
    }
    int calls = 0;
    rdd::ProgressSample last;
};

// =============================================================================
// Equivalence with the single-path engine
// =============================================================================

TEST(static_partition_matches_single) {
    TempFile in(100 * 1000 + 17);
    check_equivalent(in.path(), rdd::JobOptions().block_size(1000).count(101), 4);
    check_equivalent(in.path(), rdd::JobOptions().block_size(1000).count(60), 7);
}

TEST(static_partition_count_beyond_input) {
    TempFile in(10 * 4096 + 100);
    check_equivalent(in.path(), rdd::JobOptions().block_size(4096).count(40), 3);
}

TEST(claimed_ranges_until_eof) {
    TempFile in(257 * 512 + 300);
    check_equivalent(in.path(), rdd::JobOptions().block_size(512), 4);
    check_equivalent(in.path(), rdd::JobOptions().block_size(512).claim_blocks(3), 5);
}

TEST(claimed_ranges_exact_multiple) {
    TempFile in(64 * 1024);
    check_equivalent(in.path(), rdd::JobOptions().block_size(1024), 3);
}

TEST(skip_and_seek_match_single) {
    TempFile in(50000);
    check_equivalent(in.path(), rdd::JobOptions().block_size(1024).skip(3).seek(5), 4);
    check_equivalent(in.path(), rdd::JobOptions().block_size(1024).skip(3).seek(5).count(20), 4);
}

TEST(ordered_digest_matches_single) {
    TempFile in(300 * 1024 + 999);
    auto base = rdd::JobOptions().block_size(4096).verify(rdd::HashAlgorithm::Sha256);
    check_equivalent(in.path(), base, 4);
    check_equivalent(in.path(), rdd::JobOptions(base).count(50), 8);
    check_equivalent(in.path(), rdd::JobOptions(base).verify(rdd::HashAlgorithm::Blake3), 3);
}

TEST(ordered_digest_with_large_claims) {
    TempFile in(200 * 1000);
    check_equivalent(in.path(),
                     rdd::JobOptions()
                         .block_size(1000)
                         .claim_blocks(16)
                         .verify(rdd::HashAlgorithm::Blake3),
                     6);
}

TEST(digest_matches_hash_range_of_output) {
    TempFile in(123457);
    TempDir dir;
    auto out = dir.path("out");

    auto r = run_copy(rdd::JobOptions()
                          .input(in.path())
                          .output(out)
                          .block_size(2048)
                          .threads(5)
                          .verify(rdd::HashAlgorithm::Sha256)
                          .readback());
    ASSERT(r.verification() == rdd::VerificationStatus::Matched);
    ASSERT(r.digest());
    ASSERT_EQ(*r.digest(), *r.readback_digest());

    rdd::EndpointOptions opts;
    opts.path = out;
    auto ep = rdd::open_endpoint(opts);
    ASSERT_EQ(rdd::to_hex(rdd::hash_range(*ep, 0, 0, rdd::HashAlgorithm::Sha256, 4096)),
              *r.digest());
}

TEST(more_threads_than_blocks) {
    TempFile in(3000);
    check_equivalent(in.path(), rdd::JobOptions().block_size(1024).count(3), 16);
    check_equivalent(in.path(), rdd::JobOptions().block_size(1024), 16);
}

TEST(empty_input) {
    TempFile in(0);
    check_equivalent(in.path(), rdd::JobOptions().block_size(1024), 4);
    check_equivalent(in.path(),
                     rdd::JobOptions().block_size(1024).verify(rdd::HashAlgorithm::Sha256), 4);
}

TEST(reports_shard_count) {
    TempFile in(16 * 1024);
    TempDir dir;
    auto out = dir.path("out");

    auto r = run_copy(
        rdd::JobOptions().input(in.path()).output(out).block_size(1024).count(16).threads(4));
    ASSERT_EQ(r.shards(), 4u);

    r = run_copy(
        rdd::JobOptions().input(in.path()).output(out).block_size(1024).count(2).threads(4));
    ASSERT_EQ(r.shards(), 2u);
}

TEST(uring_backend_matches_single) {
    TempFile in(90000);
    try {
        check_equivalent(in.path(),
                         rdd::JobOptions()
                             .block_size(4096)
                             .backend(rdd::Backend::Uring)
                             .verify(rdd::HashAlgorithm::Sha256),
                         4);
    } catch (const rdd::Error &e) {
        int err = e.code();
        if (err != ENOSYS && err != EPERM && err != EACCES) throw;
        printf(" (io_uring unavailable)");
    }
}

// =============================================================================
// Failures
// =============================================================================

TEST(missing_input_does_not_create_output) {
    TempDir dir;
    auto in = dir.path("missing");
    auto out = dir.path("out");

    ASSERT_THROWS_KIND(
        run_copy(rdd::JobOptions().input(in).output(out).block_size(512).threads(4)),
        rdd::ErrorKind::Io);
    ASSERT(!path_exists(out));
}

TEST(unreadable_input_fails_as_io) {
    // A directory opens read-only but every read fails with EISDIR.
    TempDir dir;
    auto out = dir.path("out");

    ASSERT_THROWS_KIND(
        run_copy(rdd::JobOptions().input(dir.root()).output(out).block_size(512).threads(4)),
        rdd::ErrorKind::Io);
    ASSERT_THROWS_KIND(run_copy(rdd::JobOptions()
                                    .input(dir.root())
                                    .output(out)
                                    .block_size(512)
                                    .threads(4)
                                    .verify(rdd::HashAlgorithm::Sha256)),
                       rdd::ErrorKind::Io);
}

/**
 * Lowers the soft file-size limit for the lifetime of the guard
 *
 * SIGXFSZ is ignored meanwhile so oversized writes fail with EFBIG.
 */
class FileSizeLimit {
  public:
    explicit FileSizeLimit(rlim_t bytes) {
        if (getrlimit(RLIMIT_FSIZE, &saved_) != 0) {
            throw std::runtime_error("getrlimit failed");
        }
        old_handler_ = signal(SIGXFSZ, SIG_IGN);
        struct rlimit lowered = saved_;
        lowered.rlim_cur = bytes;
        if (setrlimit(RLIMIT_FSIZE, &lowered) != 0) {
            signal(SIGXFSZ, old_handler_);
            throw std::runtime_error("setrlimit failed");
        }
    }

    ~FileSizeLimit() {
        setrlimit(RLIMIT_FSIZE, &saved_);
        signal(SIGXFSZ, old_handler_);
    }

    FileSizeLimit(const FileSizeLimit &) = delete;
    FileSizeLimit &operator=(const FileSizeLimit &) = delete;

  private:
    struct rlimit saved_ {};
    void (*old_handler_)(int) = SIG_DFL;
};

/**
 * Run a job whose writes fail past the limit; check the error and that
 * every block that did land matches the input
 */
static void check_partial_failure(const TempFile &in, rdd::JobOptions opts, std::size_t bs,
                                  std::size_t limit) {
    TempDir dir;
    auto out = dir.path("out");
    opts.input(in.path()).output(out).block_size(bs).threads(8);

    bool caught = false;
    {
        FileSizeLimit guard(limit);
        try {
            (void)run_copy(opts);
        } catch (const rdd::Error &e) {
            ASSERT(e.kind() == rdd::ErrorKind::Io);
            ASSERT_EQ(e.code(), EFBIG);
            // The reported failure is the earliest one, which lies at or past the limit.
            std::string what = e.what();
            auto at = what.find("at offset ");
            ASSERT(at != std::string::npos);
            ASSERT_GE(std::stoull(what.substr(at + 10)), limit);
            caught = true;
        }
    }
    ASSERT(caught);

    // No rollback: blocks below the limit are either the input or a hole.
    auto got = read_file(out);
    ASSERT(got.size() <= limit);
    const std::vector<std::uint8_t> zeros(bs, 0);
    for (std::size_t off = 0; off < got.size(); off += bs) {
        std::size_t len = std::min(bs, got.size() - off);
        bool copied = std::equal(got.begin() + off, got.begin() + off + len,
                                 in.data().begin() + off);
        bool hole = std::equal(got.begin() + off, got.begin() + off + len, zeros.begin());
        ASSERT(copied || hole);
    }
}

TEST(shard_write_failure_fails_job) {
    const std::size_t bs = 64 * 1024;
    const std::size_t limit = 1024 * 1024;
    TempFile in(4 * limit);

    // Static plan
    check_partial_failure(in, rdd::JobOptions().count(64), bs, limit);
    // Claimed ranges
    check_partial_failure(in, rdd::JobOptions(), bs, limit);
    // Claimed ranges with the ordered digest drain
    check_partial_failure(in, rdd::JobOptions().verify(rdd::HashAlgorithm::Sha256), bs, limit);
    check_partial_failure(in, rdd::JobOptions().count(64).verify(rdd::HashAlgorithm::Blake3), bs,
                          limit);
}

TEST(direct_io_copy_with_unaligned_tail) {
    // tmpfs rejects O_DIRECT; use the working directory.
    TempDir dir(".");
    auto in = dir.path("in");
    auto data = make_pattern(10000);
    write_file(in, data);

    for (unsigned threads : {1u, 4u}) {
        auto out = dir.path("out" + std::to_string(threads));
        std::optional<rdd::JobResult> r;
        try {
            r = run_copy(rdd::JobOptions()
                             .input(in)
                             .output(out)
                             .block_size(4096)
                             .threads(threads)
                             .direct(true)
                             .verify(rdd::HashAlgorithm::Sha256)
                             .readback());
        } catch (const rdd::Error &e) {
            if (!e.is_config() || e.code() != EINVAL) throw;
            printf(" (direct I/O unsupported here)");
            return;
        }
        ASSERT_EQ(r->full_blocks(), 2u);
        ASSERT_EQ(r->partial_blocks(), 1u);
        ASSERT_EQ(r->bytes_copied(), 10000u);
        ASSERT(r->verification() == rdd::VerificationStatus::Matched);
        ASSERT(read_file(out) == data);
    }
}

TEST(cancel_stops_all_shards) {
    TempFile in(64 * 1024);
    TempDir dir;
    auto out = dir.path("out");
    rdd::CancelToken token;
    token.request();

    ASSERT_THROWS_KIND(
        run_copy(rdd::JobOptions().input(in.path()).output(out).block_size(1024).threads(4),
                 nullptr, &token),
        rdd::ErrorKind::Cancelled);
    ASSERT_THROWS_KIND(run_copy(rdd::JobOptions()
                                    .input(in.path())
                                    .output(out)
                                    .block_size(1024)
                                    .threads(4)
                                    .verify(rdd::HashAlgorithm::Blake3),
                                nullptr, &token),
                       rdd::ErrorKind::Cancelled);
}

TEST(progress_final_sample_sums_shards) {
    TempFile in(128 * 1024);
    TempDir dir;
    auto out = dir.path("out");
    CountingSink sink;

    auto r = run_copy(rdd::JobOptions()
                          .input(in.path())
                          .output(out)
                          .block_size(4096)
                          .threads(4)
                          .progress_interval_ms(1),
                      &sink);
    ASSERT_GE(sink.calls, 1);
    ASSERT(sink.last.final);
    ASSERT_EQ(sink.last.bytes_done, r.bytes_copied());
    ASSERT_EQ(sink.last.bytes_done, 128u * 1024u);
}

int main() {
    printf("Running sharded engine tests...\n");

    RUN_TEST(static_partition_matches_single);
    RUN_TEST(static_partition_count_beyond_input);
    RUN_TEST(claimed_ranges_until_eof);
    RUN_TEST(claimed_ranges_exact_multiple);
    RUN_TEST(skip_and_seek_match_single);
    RUN_TEST(ordered_digest_matches_single);
    RUN_TEST(ordered_digest_with_large_claims);
    RUN_TEST(digest_matches_hash_range_of_output);
    RUN_TEST(more_threads_than_blocks);
    RUN_TEST(empty_input);
    RUN_TEST(reports_shard_count);
    RUN_TEST(uring_backend_matches_single);

    RUN_TEST(missing_input_does_not_create_output);
    RUN_TEST(unreadable_input_fails_as_io);
    RUN_TEST(shard_write_failure_fails_job);
    RUN_TEST(direct_io_copy_with_unaligned_tail);
    RUN_TEST(cancel_stops_all_shards);
    RUN_TEST(progress_final_sample_sums_shards);

    TEST_SUMMARY();
    return tests_failed > 0 ? 1 : 0;
}
