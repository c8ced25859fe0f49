// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 rdd Contributors


/**
 * @file options.cpp
 * @brief Name tables and size-string setter for JobOptions
 */

#include <rdd/error.hpp>
#include <rdd/options.hpp>
#include <rdd/size.hpp>

#include <algorithm>
#include <cctype>
#include <string>

namespace rdd {

namespace {

std::string lowercase(std::string_view text) {
    std::string out(text);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

} // namespace

const char *hash_algorithm_name(HashAlgorithm algo) noexcept {
    switch (algo) {
    case HashAlgorithm::None:
        return "none";
    case HashAlgorithm::Sha256:
        return "sha256";
    case HashAlgorithm::Blake3:
        return "blake3";
    default:
        return "???";
    }
}

HashAlgorithm parse_hash_algorithm(std::string_view name) {
    std::string key = lowercase(name);
    if (key == "none") return HashAlgorithm::None;
    if (key == "sha256") return HashAlgorithm::Sha256;
    if (key == "blake3") return HashAlgorithm::Blake3;
    throw config_error("unknown verification algorithm '" + std::string(name) + "'");
}

const char *backend_name(Backend backend) noexcept {
    switch (backend) {
    case Backend::Posix:
        return "posix";
    case Backend::Uring:
        return "uring";
    default:
        return "???";
    }
}

Backend parse_backend(std::string_view name) {
    std::string key = lowercase(name);
    if (key == "posix") return Backend::Posix;
    if (key == "uring" || key == "io_uring") return Backend::Uring;
    throw config_error("unknown I/O backend '" + std::string(name) + "'");
}

JobOptions &JobOptions::block_size(std::string_view text) {
    block_size_ = parse_size(text);
    return *this;
}

} // namespace rdd
