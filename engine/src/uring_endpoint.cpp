// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 rdd Contributors


/**
 * @file uring_endpoint.cpp
 * @brief io_uring endpoint backend
 */

#include "uring_endpoint.h"

#include "log.h"

#include <rdd/error.hpp>

#include <cerrno>

namespace rdd::detail {

UringEndpoint::UringEndpoint(std::string path, OpenedFile file)
    : FileEndpoint(std::move(path), std::move(file)) {
    int rc = io_uring_queue_init(URING_QUEUE_DEPTH, &ring_, 0);
    if (rc < 0) {
        throw Error(-rc, "io_uring_queue_init for '" + this->path() + "'");
    }
    RDD_LOG_DEBUG("'%s': io_uring ring ready (depth %u)", this->path().c_str(),
                  URING_QUEUE_DEPTH);
}

UringEndpoint::~UringEndpoint() {
    io_uring_queue_exit(&ring_);
}

int UringEndpoint::submit_one() {
    int rc;
    do {
        rc = io_uring_submit_and_wait(&ring_, 1);
    } while (rc == -EINTR);
    if (rc < 0) {
        return rc;
    }

    struct io_uring_cqe *cqe = nullptr;
    do {
        rc = io_uring_wait_cqe(&ring_, &cqe);
    } while (rc == -EINTR);
    if (rc < 0) {
        return rc;
    }
    int res = cqe->res;
    io_uring_cqe_seen(&ring_, cqe);
    return res;
}

ssize_t UringEndpoint::read_once(void *buf, std::size_t len, off_t offset) {
    struct io_uring_sqe *sqe = io_uring_get_sqe(&ring_);
    if (!sqe) {
        return -EBUSY;
    }
    io_uring_prep_read(sqe, fd(), buf, static_cast<unsigned>(len), static_cast<__u64>(offset));
    return submit_one();
}

ssize_t UringEndpoint::write_once(const void *buf, std::size_t len, off_t offset) {
    struct io_uring_sqe *sqe = io_uring_get_sqe(&ring_);
    if (!sqe) {
        return -EBUSY;
    }
    io_uring_prep_write(sqe, fd(), buf, static_cast<unsigned>(len), static_cast<__u64>(offset));
    return submit_one();
}

int UringEndpoint::sync_once() {
    struct io_uring_sqe *sqe = io_uring_get_sqe(&ring_);
    if (!sqe) {
        return -EBUSY;
    }
    io_uring_prep_fsync(sqe, fd(), IORING_FSYNC_DATASYNC);
    return submit_one();
}

} // namespace rdd::detail
