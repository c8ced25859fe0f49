// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 rdd Contributors


/**
 * @file rdd.hpp
 * @brief Main header for the rdd block-copy library
 *
 * This is the single header you need to include to use rdd from C++.
 *
 * Example:
 * @code
 * #include <rdd.hpp>
 *
 * int main() {
 *     rdd::JobOptions opts;
 *     opts.input("/dev/sdb").output("disk.img").block_size("4M").threads(4);
 *     opts.verify(rdd::HashAlgorithm::Sha256).readback();
 *
 *     auto result = rdd::run_job(rdd::JobDescriptor::from_options(opts));
 *     result.throw_if_mismatch();
 *     std::cout << result.bytes_copied() << " bytes, " << *result.digest() << "\n";
 * }
 * @endcode
 */

#ifndef RDD_HPP
#define RDD_HPP

// Order matters for dependencies
#include <rdd/fwd.hpp>
#include <rdd/error.hpp>
#include <rdd/log.hpp>
#include <rdd/size.hpp>
#include <rdd/options.hpp>
#include <rdd/job.hpp>
#include <rdd/buffer.hpp>
#include <rdd/endpoint.hpp>
#include <rdd/digest.hpp>
#include <rdd/progress.hpp>
#include <rdd/stats.hpp>
#include <rdd/engine.hpp>

/// Library version
#define RDD_VERSION_MAJOR 0
#define RDD_VERSION_MINOR 3
#define RDD_VERSION_PATCH 0
#define RDD_VERSION_STRING "0.3.0"

#endif // RDD_HPP
