// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 rdd Contributors


/**
 * @file endpoint.cpp
 * @brief Endpoint factory and cursor operations
 */

#include <rdd/endpoint.hpp>
#include <rdd/error.hpp>

#include "file_endpoint.h"
#include "internal.h"
#include "uring_endpoint.h"

#include <string>

namespace rdd {

const char *resource_kind_name(ResourceKind kind) noexcept {
    switch (kind) {
    case ResourceKind::RegularFile:
        return "file";
    case ResourceKind::BlockDevice:
        return "block device";
    case ResourceKind::Other:
        return "other";
    default:
        return "???";
    }
}

void Endpoint::seek(std::uint64_t offset) {
    if (offset > detail::MAX_OFFSET) {
        throw Error(EOVERFLOW, "seek '" + path_ + "' to " + std::to_string(offset));
    }
    position_ = offset;
}

std::unique_ptr<Endpoint> open_endpoint(const EndpointOptions &opts) {
    if (opts.path.empty()) {
        throw config_error("empty path");
    }

    detail::OpenedFile file = detail::open_file(opts);

    std::unique_ptr<Endpoint> endpoint;
    switch (opts.backend) {
    case Backend::Uring:
        endpoint = std::make_unique<detail::UringEndpoint>(opts.path, std::move(file));
        break;
    case Backend::Posix:
    default:
        endpoint = std::make_unique<detail::FileEndpoint>(opts.path, std::move(file));
        break;
    }
    endpoint->seek(opts.start_offset);
    return endpoint;
}

} // namespace rdd
