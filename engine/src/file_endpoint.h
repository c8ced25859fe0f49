// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 rdd Contributors


/**
 * @file file_endpoint.h
 * @brief Descriptor-backed endpoint (POSIX backend)
 *
 * Internal header - not part of public API.
 */

#ifndef RDD_FILE_ENDPOINT_H
#define RDD_FILE_ENDPOINT_H

#include <rdd/endpoint.hpp>

#include <cstddef>
#include <cstdint>
#include <sys/types.h>

namespace rdd::detail {

/// Largest single transfer handed to the kernel (Linux caps at 0x7ffff000)
inline constexpr std::size_t MAX_IO_CHUNK = 1UL << 30;

/**
 * Owning file descriptor
 */
class UniqueFd {
  public:
    UniqueFd() noexcept = default;
    explicit UniqueFd(int fd) noexcept : fd_(fd) {}
    ~UniqueFd() { reset(); }

    UniqueFd(UniqueFd &&other) noexcept : fd_(other.release()) {}
    UniqueFd &operator=(UniqueFd &&other) noexcept {
        if (this != &other) {
            reset(other.release());
        }
        return *this;
    }

    UniqueFd(const UniqueFd &) = delete;
    UniqueFd &operator=(const UniqueFd &) = delete;

    [[nodiscard]] int get() const noexcept { return fd_; }
    [[nodiscard]] explicit operator bool() const noexcept { return fd_ >= 0; }

    int release() noexcept {
        int fd = fd_;
        fd_ = -1;
        return fd;
    }

    void reset(int fd = -1) noexcept;

  private:
    int fd_ = -1;
};

/**
 * Result of opening and validating a path
 */
struct OpenedFile {
    UniqueFd fd;
    ResourceKind kind = ResourceKind::Other;
    std::size_t alignment = 1; ///< Device logical block size when direct, else 1
    bool direct = false;
};

/**
 * Open a path per EndpointOptions
 *
 * Handles create/truncate ordering so a direct-I/O misalignment is
 * reported before any existing data is truncated.
 */
[[nodiscard]] OpenedFile open_file(const EndpointOptions &opts);

/**
 * Endpoint over a file descriptor using pread/pwrite/fdatasync
 *
 * The transfer loops (short transfers, EINTR, direct-I/O tails) live
 * here; backends override only the single-operation primitives, which
 * return a byte count or a negative errno.
 */
class FileEndpoint : public Endpoint {
  public:
    FileEndpoint(std::string path, OpenedFile file) noexcept;
    ~FileEndpoint() override = default;

    [[nodiscard]] std::size_t read_at(void *buf, std::size_t len, std::uint64_t offset) override;
    void write_at(const void *buf, std::size_t len, std::uint64_t offset) override;
    void flush() override;
    [[nodiscard]] std::size_t alignment() const noexcept override { return alignment_; }
    [[nodiscard]] std::uint64_t size() const override;

  protected:
    [[nodiscard]] int fd() const noexcept { return fd_.get(); }

    /// One read; bytes or -errno
    virtual ssize_t read_once(void *buf, std::size_t len, off_t offset);

    /// One write; bytes or -errno
    virtual ssize_t write_once(const void *buf, std::size_t len, off_t offset);

    /// One data sync; 0 or -errno
    virtual int sync_once();

  private:
    void drop_direct();

    UniqueFd fd_;
    std::size_t alignment_;
    bool direct_;
};

} // namespace rdd::detail

#endif // RDD_FILE_ENDPOINT_H
