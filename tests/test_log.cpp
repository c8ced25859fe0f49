// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 rdd Contributors


/**
 * @file test_log.cpp
 * @brief Tests for the log handler API and syslog forwarding
 */

#include "test_harness.hpp"

#include "rdd_syslog.hpp"

#include <atomic>
#include <mutex>
#include <string>
#include <thread>

/// Installs a capturing handler for the lifetime of the object
class CaptureLog {
  public:
    CaptureLog() {
        rdd::set_log_handler([this](rdd::LogLevel level, std::string_view msg) {
            std::lock_guard<std::mutex> guard(lock_);
            entries_.emplace_back(level, std::string(msg));
        });
    }
    ~CaptureLog() { rdd::clear_log_handler(); }

    CaptureLog(const CaptureLog &) = delete;
    CaptureLog &operator=(const CaptureLog &) = delete;

    bool contains(rdd::LogLevel level, const std::string &needle) const {
        std::lock_guard<std::mutex> guard(lock_);
        for (const auto &e : entries_) {
            if (e.first == level && e.second.find(needle) != std::string::npos) return true;
        }
        return false;
    }

    std::size_t size() const {
        std::lock_guard<std::mutex> guard(lock_);
        return entries_.size();
    }

  private:
    mutable std::mutex lock_;
    std::vector<std::pair<rdd::LogLevel, std::string>> entries_;
};

TEST(level_names) {
    ASSERT_EQ(std::string(rdd::log_level_name(rdd::LogLevel::Error)), "ERR");
    ASSERT_EQ(std::string(rdd::log_level_name(rdd::LogLevel::Warning)), "WARN");
    ASSERT_EQ(std::string(rdd::log_level_name(rdd::LogLevel::Notice)), "NOTICE");
    ASSERT_EQ(std::string(rdd::log_level_name(rdd::LogLevel::Info)), "INFO");
    ASSERT_EQ(std::string(rdd::log_level_name(rdd::LogLevel::Debug)), "DEBUG");
    ASSERT_EQ(static_cast<int>(rdd::LogLevel::Error), 3);
    ASSERT_EQ(static_cast<int>(rdd::LogLevel::Debug), 7);
}

TEST(silent_without_handler) {
    rdd::clear_log_handler();
    ASSERT(!rdd::log_enabled());
    rdd::log_emit(rdd::LogLevel::Error, "nobody listens");
}

TEST(emit_reaches_handler) {
    CaptureLog log;
    ASSERT(rdd::log_enabled());
    rdd::log_emit(rdd::LogLevel::Notice, "hello");
    ASSERT(log.contains(rdd::LogLevel::Notice, "hello"));
}

TEST(clear_stops_delivery) {
    std::size_t before = 0;
    {
        CaptureLog log;
        rdd::log_emit(rdd::LogLevel::Info, "one");
        before = log.size();
    }
    ASSERT_EQ(before, 1u);
    ASSERT(!rdd::log_enabled());
}

TEST(copy_logs_job_summary) {
    TempFile in(5000);
    TempDir dir;
    auto out = dir.path("out");
    CaptureLog log;

    auto job = rdd::JobDescriptor::from_options(
        rdd::JobOptions().input(in.path()).output(out).block_size(1024));
    (void)rdd::run_job(job);
    ASSERT(log.contains(rdd::LogLevel::Info, "copy '" + in.path() + "'"));
    ASSERT(log.contains(rdd::LogLevel::Info, "4+1 blocks"));
}

TEST(failed_copy_logs_error) {
    TempDir dir;
    auto in = dir.path("missing");
    auto out = dir.path("out");
    CaptureLog log;

    auto job = rdd::JobDescriptor::from_options(rdd::JobOptions().input(in).output(out));
    ASSERT_THROWS_KIND((void)rdd::run_job(job), rdd::ErrorKind::Io);
    ASSERT(log.contains(rdd::LogLevel::Error, "copy failed"));
}

TEST(mismatch_logs_warning) {
    TempFile in(100);
    TempDir dir;
    auto out = dir.path("out");
    CaptureLog log;

    auto job = rdd::JobDescriptor::from_options(rdd::JobOptions()
                                                    .input(in.path())
                                                    .output(out)
                                                    .verify(rdd::HashAlgorithm::Blake3)
                                                    .expect_digest(std::string(64, 'f')));
    auto r = rdd::run_job(job);
    ASSERT(r.verification() == rdd::VerificationStatus::Mismatch);
    ASSERT(log.contains(rdd::LogLevel::Warning, "mismatch"));
}

TEST(handler_called_from_shard_threads) {
    TempFile in(64 * 1024);
    TempDir dir;
    auto out = dir.path("out");
    CaptureLog log;

    auto job = rdd::JobDescriptor::from_options(
        rdd::JobOptions().input(in.path()).output(out).block_size(4096).threads(4));
    (void)rdd::run_job(job);
    ASSERT(log.contains(rdd::LogLevel::Debug, "shard "));
}

TEST(concurrent_emit) {
    CaptureLog log;
    std::vector<std::thread> threads;
    for (int t = 0; t < 8; t++) {
        threads.emplace_back([] {
            for (int i = 0; i < 200; i++) {
                rdd::log_emit(rdd::LogLevel::Debug, "tick");
            }
        });
    }
    for (auto &t : threads) t.join();
    ASSERT_EQ(log.size(), 1600u);
}

TEST(syslog_install_and_remove) {
    rdd::SyslogOptions opts;
    opts.ident = "rdd-test";
    opts.max_level = rdd::LogLevel::Warning;
    rdd::syslog_install(&opts);
    ASSERT(rdd::log_enabled());
    rdd::log_emit(rdd::LogLevel::Debug, "dropped by max_level");
    rdd::syslog_remove();
    ASSERT(!rdd::log_enabled());

    rdd::syslog_install();
    ASSERT(rdd::log_enabled());
    rdd::syslog_remove();
    ASSERT(!rdd::log_enabled());
}

int main() {
    printf("Running log tests...\n");

    RUN_TEST(level_names);
    RUN_TEST(silent_without_handler);
    RUN_TEST(emit_reaches_handler);
    RUN_TEST(clear_stops_delivery);
    RUN_TEST(copy_logs_job_summary);
    RUN_TEST(failed_copy_logs_error);
    RUN_TEST(mismatch_logs_warning);
    RUN_TEST(handler_called_from_shard_threads);
    RUN_TEST(concurrent_emit);
    RUN_TEST(syslog_install_and_remove);

    TEST_SUMMARY();
    return tests_failed > 0 ? 1 : 0;
}
