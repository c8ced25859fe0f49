// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 rdd Contributors


/**
 * @file cancel_copy.cpp
 * @brief Demonstrates progress reporting and cancelling a running copy
 *
 * A progress sink prints each sample and requests cancellation once half
 * of the input has been copied. The job then fails with
 * ErrorKind::Cancelled at the next block boundary.
 *
 * Usage: ./cancel_copy <input> <output> [threads]
 */

#include <rdd.hpp>

#include <cstdlib>
#include <iostream>

/// Prints samples; cancels after a byte threshold
class HalfwayCanceller : public rdd::ProgressSink {
  public:
    HalfwayCanceller(rdd::CancelToken &token, std::uint64_t threshold)
        : token_(token), threshold_(threshold) {}

    void on_progress(const rdd::ProgressSample &sample) override {
        std::cout << "  " << rdd::format_bytes(sample.bytes_done) << " copied"
                  << (sample.final ? " (final)" : "") << "\n";
        if (!token_.requested() && sample.bytes_done >= threshold_) {
            std::cout << "  requesting cancel\n";
            token_.request();
        }
    }

  private:
    rdd::CancelToken &token_;
    std::uint64_t threshold_;
};

int main(int argc, char *argv[]) {
    if (argc < 3) {
        std::cerr << "Usage: " << argv[0] << " <input> <output> [threads]\n";
        return 1;
    }
    unsigned threads = argc > 3 ? static_cast<unsigned>(std::strtoul(argv[3], nullptr, 10)) : 1;

    try {
        auto job = rdd::JobDescriptor::from_options(rdd::JobOptions()
                                                        .input(argv[1])
                                                        .output(argv[2])
                                                        .block_size(64 * 1024)
                                                        .threads(threads)
                                                        .progress_interval_ms(0));

        // Size of the input decides where to cancel
        rdd::EndpointOptions probe;
        probe.path = argv[1];
        std::uint64_t size = rdd::open_endpoint(probe)->size();

        rdd::CancelToken token;
        HalfwayCanceller sink(token, size / 2);

        std::cout << "Copying " << rdd::format_bytes(size) << " with " << job.thread_count()
                  << " thread(s)...\n";
        auto result = rdd::run_job(job, &sink, &token);
        std::cout << "Copy finished before the cancel landed: " << result.bytes_copied()
                  << " bytes\n";
        return 0;

    } catch (const rdd::Error &e) {
        if (e.kind() == rdd::ErrorKind::Cancelled) {
            std::cout << "Copy was cancelled (" << e.what() << ")\n";
            return 0;
        }
        std::cerr << "rdd error (" << rdd::error_kind_name(e.kind()) << "): " << e.what() << "\n";
        return 1;
    }
}
