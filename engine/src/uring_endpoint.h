// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 rdd Contributors


/**
 * @file uring_endpoint.h
 * @brief io_uring endpoint backend
 *
 * Internal header - not part of public API.
 */

#ifndef RDD_URING_ENDPOINT_H
#define RDD_URING_ENDPOINT_H

#include "file_endpoint.h"

#include <liburing.h>

namespace rdd::detail {

/** Entries in each handle's private ring. Operations are issued one at a time. */
inline constexpr unsigned URING_QUEUE_DEPTH = 4;

/**
 * FileEndpoint whose primitives go through a private io_uring ring
 *
 * Each handle owns its ring, so no ring is ever shared between threads.
 * Each primitive submits one SQE and waits for its completion; the
 * transfer loops in FileEndpoint are reused unchanged.
 */
class UringEndpoint : public FileEndpoint {
  public:
    /**
     * @throws Error (kind Io) if the ring cannot be created
     */
    UringEndpoint(std::string path, OpenedFile file);
    ~UringEndpoint() override;

  protected:
    ssize_t read_once(void *buf, std::size_t len, off_t offset) override;
    ssize_t write_once(const void *buf, std::size_t len, off_t offset) override;
    int sync_once() override;

  private:
    /// Submit the prepared SQE and reap its result (bytes or -errno)
    int submit_one();

    struct io_uring ring_;
};

} // namespace rdd::detail

#endif // RDD_URING_ENDPOINT_H
