// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 rdd Contributors


/**
 * @file quickstart.cpp
 * @brief Minimal working example of an rdd copy job
 *
 * Run:   ./examples/cpp/quickstart
 */

#include <rdd.hpp>

#include <cstring>
#include <fstream>
#include <iostream>
#include <unistd.h>

int main() {
    const char *src_file = "/tmp/rdd_quickstart_src.tmp";
    const char *dst_file = "/tmp/rdd_quickstart_dst.tmp";
    const char *test_data = "Hello from rdd! This is a block copy.\n";

    try {
        // Create a source file with known content
        {
            std::ofstream out(src_file, std::ios::binary);
            if (!out) {
                std::cerr << "Failed to create source file\n";
                return 1;
            }
            out.write(test_data, static_cast<std::streamsize>(strlen(test_data)));
        }

        // Describe the job: 16-byte blocks, SHA-256 over the copied bytes
        auto job = rdd::JobDescriptor::from_options(rdd::JobOptions()
                                                        .input(src_file)
                                                        .output(dst_file)
                                                        .block_size(16)
                                                        .verify(rdd::HashAlgorithm::Sha256)
                                                        .readback());

        auto result = rdd::run_job(job);

        std::cout << result.full_blocks() << "+" << result.partial_blocks() << " records copied, "
                  << result.bytes_copied() << " bytes\n";
        std::cout << "sha256: " << result.digest().value_or("-") << " ("
                  << rdd::verification_status_name(result.verification()) << ")\n";
        result.throw_if_mismatch();

        unlink(src_file);
        unlink(dst_file);

        std::cout << "Success!\n";
        return 0;

    } catch (const rdd::Error &e) {
        std::cerr << "rdd error (" << rdd::error_kind_name(e.kind()) << "): " << e.what() << "\n";
        unlink(src_file);
        unlink(dst_file);
        return 1;
    } catch (const std::exception &e) {
        std::cerr << "Error: " << e.what() << "\n";
        unlink(src_file);
        unlink(dst_file);
        return 1;
    }
}
