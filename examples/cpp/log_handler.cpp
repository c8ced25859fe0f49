// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 rdd Contributors


/**
 * @file log_handler.cpp
 * @brief Demonstrate a custom rdd log handler
 *
 * Shows how to install a log callback that formats library messages with
 * timestamps and severity levels, and how to emit application-level
 * messages through the same pipeline using rdd::log_emit().
 *
 * Run:   ./examples/cpp/log_handler
 */

#include <rdd.hpp>

#include <chrono>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <unistd.h>

constexpr auto SRC_FILE = "/tmp/rdd_log_src.dat";
constexpr auto DST_FILE = "/tmp/rdd_log_dst.dat";
constexpr size_t FILE_SIZE = 256 * 1024; // 256 KB

int main() {
    std::cout << "rdd Log Handler Example\n";
    std::cout << "=======================\n\n";

    // --- Step 1: Install log handler with lambda -------------------------
    //
    // Any callable works; here a lambda that prefixes each message with a
    // millisecond timestamp and severity tag.

    rdd::set_log_handler([](rdd::LogLevel level, std::string_view msg) {
        auto now = std::chrono::system_clock::now();
        auto time_t_now = std::chrono::system_clock::to_time_t(now);
        auto ms =
            std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

        std::tm tm{};
        localtime_r(&time_t_now, &tm);

        std::cerr << std::put_time(&tm, "%Y-%m-%d %H:%M:%S") << '.' << std::setfill('0')
                  << std::setw(3) << ms.count() << " [myapp] " << rdd::log_level_name(level)
                  << ": " << msg << '\n';
    });

    // --- Step 2: Emit application-level messages -------------------------
    rdd::log_emit(rdd::LogLevel::Info, "log handler installed, preparing source");

    {
        std::ofstream out(SRC_FILE, std::ios::binary);
        if (!out) {
            rdd::log_emit(rdd::LogLevel::Error, "failed to create source file");
            rdd::clear_log_handler();
            return 1;
        }
        std::string data(FILE_SIZE, 'A');
        out.write(data.data(), static_cast<std::streamsize>(data.size()));
    }

    int rc = 0;
    try {
        // --- Step 3: Run a sharded copy; the engine logs its plan --------
        auto job = rdd::JobDescriptor::from_options(rdd::JobOptions()
                                                        .input(SRC_FILE)
                                                        .output(DST_FILE)
                                                        .block_size(64 * 1024)
                                                        .threads(2)
                                                        .verify(rdd::HashAlgorithm::Blake3));
        auto result = rdd::run_job(job);
        rdd::log_emit(rdd::LogLevel::Notice, "copy finished");
        std::cout << "\nCopied " << result.bytes_copied() << " bytes, blake3 "
                  << result.digest().value_or("-") << "\n";

        // --- Step 4: A failing job reports through the handler too -------
        try {
            auto bad = rdd::JobDescriptor::from_options(
                rdd::JobOptions().input("/nonexistent/rdd_input").output(DST_FILE));
            (void)rdd::run_job(bad);
        } catch (const rdd::Error &e) {
            std::cout << "Expected failure: " << e.what() << "\n";
        }
    } catch (const rdd::Error &e) {
        std::cerr << "rdd error: " << e.what() << "\n";
        rc = 1;
    }

    // --- Step 5: Remove the handler; the library is silent again --------
    rdd::clear_log_handler();

    unlink(SRC_FILE);
    unlink(DST_FILE);
    return rc;
}
