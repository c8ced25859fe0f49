// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 rdd Contributors


/**
 * @file file_endpoint.cpp
 * @brief Descriptor-backed endpoint (POSIX backend)
 */

#ifndef _GNU_SOURCE
#    define _GNU_SOURCE
#endif

#include "file_endpoint.h"

#include "internal.h"
#include "log.h"

#include <rdd/error.hpp>

#include <algorithm>
#include <cerrno>
#include <string>

#include <fcntl.h>
#include <linux/fs.h>
#include <sys/ioctl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace rdd::detail {

namespace {

constexpr std::size_t FALLBACK_SECTOR_SIZE = 512;

const char *mode_name(OpenMode mode) {
    switch (mode) {
    case OpenMode::Read:
        return "reading";
    case OpenMode::CreateTruncate:
        return "writing";
    case OpenMode::WriteExisting:
        return "shard writing";
    default:
        return "???";
    }
}

std::string at_offset(const std::string &what, const std::string &path, std::uint64_t offset) {
    return what + " '" + path + "' at offset " + std::to_string(offset);
}

ResourceKind classify(const struct stat &st) {
    if (S_ISREG(st.st_mode)) return ResourceKind::RegularFile;
    if (S_ISBLK(st.st_mode)) return ResourceKind::BlockDevice;
    return ResourceKind::Other;
}

// Logical block size the kernel requires for O_DIRECT on this descriptor.
std::size_t discover_alignment(int fd, ResourceKind kind) {
    if (kind == ResourceKind::BlockDevice) {
        int sector = 0;
        if (ioctl(fd, BLKSSZGET, &sector) == 0 && sector > 0) {
            return static_cast<std::size_t>(sector);
        }
    }
#ifdef STATX_DIOALIGN
    struct statx stx{};
    if (statx(fd, "", AT_EMPTY_PATH, STATX_DIOALIGN, &stx) == 0 &&
        (stx.stx_mask & STATX_DIOALIGN) && stx.stx_dio_offset_align > 0) {
        return stx.stx_dio_offset_align;
    }
#endif
    return FALLBACK_SECTOR_SIZE;
}

} // namespace

void UniqueFd::reset(int fd) noexcept {
    if (fd_ >= 0) {
        ::close(fd_);
    }
    fd_ = fd;
}

OpenedFile open_file(const EndpointOptions &opts) {
    int flags = O_CLOEXEC;
    switch (opts.mode) {
    case OpenMode::Read:
        flags |= O_RDONLY;
        break;
    case OpenMode::CreateTruncate:
        flags |= O_WRONLY | O_CREAT;
        break;
    case OpenMode::WriteExisting:
        flags |= O_WRONLY;
        break;
    }
    if (opts.direct) flags |= O_DIRECT;

    // Truncation is deferred until direct-I/O alignment has been validated.
    bool existed = true;
    if (opts.mode == OpenMode::CreateTruncate) {
        struct stat pre;
        existed = ::stat(opts.path.c_str(), &pre) == 0;
    }

    int raw = -1;
    do {
        raw = ::open(opts.path.c_str(), flags, 0644);
    } while (raw < 0 && errno == EINTR);
    if (raw < 0) {
        int err = errno;
        if (opts.direct && err == EINVAL) {
            // Some filesystems create the file before rejecting O_DIRECT.
            if (!existed) {
                ::unlink(opts.path.c_str());
            }
            throw Error(ErrorKind::Config, err,
                        "direct I/O not supported for '" + opts.path + "'");
        }
        throw Error(err, std::string("cannot open '") + opts.path + "' for " +
                             mode_name(opts.mode));
    }

    OpenedFile file;
    file.fd.reset(raw);
    file.direct = opts.direct;

    struct stat st;
    if (::fstat(raw, &st) != 0) {
        throw_errno("fstat '" + opts.path + "'");
    }
    file.kind = classify(st);

    if (opts.direct) {
        file.alignment = discover_alignment(raw, file.kind);
        if (opts.block_size % file.alignment != 0) {
            file.fd.reset();
            if (!existed) {
                ::unlink(opts.path.c_str());
            }
            throw config_error("block size " + std::to_string(opts.block_size) +
                               " is not a multiple of the direct I/O alignment " +
                               std::to_string(file.alignment) + " of '" + opts.path + "'");
        }
    }

    if (opts.mode == OpenMode::CreateTruncate && file.kind == ResourceKind::RegularFile &&
        st.st_size != 0) {
        int rc;
        do {
            rc = ::ftruncate(raw, 0);
        } while (rc != 0 && errno == EINTR);
        if (rc != 0) {
            throw_errno("truncate '" + opts.path + "'");
        }
    }

    RDD_LOG_DEBUG("opened %s '%s' for %s%s (alignment %zu)", resource_kind_name(file.kind),
                  opts.path.c_str(), mode_name(opts.mode), opts.direct ? ", direct" : "",
                  file.alignment);
    return file;
}

FileEndpoint::FileEndpoint(std::string path, OpenedFile file) noexcept
    : Endpoint(std::move(path), file.kind), fd_(std::move(file.fd)), alignment_(file.alignment),
      direct_(file.direct) {}

ssize_t FileEndpoint::read_once(void *buf, std::size_t len, off_t offset) {
    ssize_t n = ::pread(fd_.get(), buf, len, offset);
    return n < 0 ? -errno : n;
}

ssize_t FileEndpoint::write_once(const void *buf, std::size_t len, off_t offset) {
    ssize_t n = ::pwrite(fd_.get(), buf, len, offset);
    return n < 0 ? -errno : n;
}

int FileEndpoint::sync_once() {
    return ::fdatasync(fd_.get()) == 0 ? 0 : -errno;
}

std::size_t FileEndpoint::read_at(void *buf, std::size_t len, std::uint64_t offset) {
    auto *p = static_cast<char *>(buf);
    std::size_t done = 0;
    while (done < len) {
        std::uint64_t pos = offset + done;
        if (pos > MAX_OFFSET) {
            throw Error(EOVERFLOW, at_offset("read", path(), pos));
        }
        std::size_t want = std::min(len - done, MAX_IO_CHUNK);
        ssize_t n = read_once(p + done, want, static_cast<off_t>(pos));
        if (n == -EINTR || n == -EAGAIN) continue;
        if (n < 0) {
            throw Error(static_cast<int>(-n), at_offset("read", path(), pos));
        }
        if (n == 0) break; // end of input
        done += static_cast<std::size_t>(n);
        // A short O_DIRECT read only happens at end of input, and the next
        // offset would be unaligned anyway.
        if (direct_ && static_cast<std::size_t>(n) < want) break;
    }
    return done;
}

void FileEndpoint::write_at(const void *buf, std::size_t len, std::uint64_t offset) {
    const auto *p = static_cast<const char *>(buf);
    std::size_t done = 0;
    while (done < len) {
        std::uint64_t pos = offset + done;
        if (pos > MAX_OFFSET) {
            throw Error(EOVERFLOW, at_offset("write", path(), pos));
        }
        std::size_t want = std::min(len - done, MAX_IO_CHUNK);
        if (direct_ && (want % alignment_ != 0 || pos % alignment_ != 0)) {
            drop_direct();
        }
        ssize_t n = write_once(p + done, want, static_cast<off_t>(pos));
        if (n == -EINTR || n == -EAGAIN) continue;
        if (n < 0) {
            throw Error(static_cast<int>(-n), at_offset("write", path(), pos));
        }
        if (n == 0) {
            throw Error(ENOSPC, at_offset("write (no progress)", path(), pos));
        }
        done += static_cast<std::size_t>(n);
    }
}

void FileEndpoint::flush() {
    int rc;
    do {
        rc = sync_once();
    } while (rc == -EINTR);
    if (rc == -EINVAL && kind() == ResourceKind::Other) {
        // Character devices and the like have nothing to synchronize.
        RDD_LOG_DEBUG("'%s' does not support sync; nothing to flush", path().c_str());
        return;
    }
    if (rc < 0) {
        throw Error(-rc, "flush '" + path() + "'");
    }
}

std::uint64_t FileEndpoint::size() const {
    if (kind() == ResourceKind::BlockDevice) {
        std::uint64_t bytes = 0;
        if (ioctl(fd_.get(), BLKGETSIZE64, &bytes) != 0) {
            throw_errno("BLKGETSIZE64 '" + path() + "'");
        }
        return bytes;
    }
    struct stat st;
    if (::fstat(fd_.get(), &st) != 0) {
        throw_errno("fstat '" + path() + "'");
    }
    return static_cast<std::uint64_t>(st.st_size);
}

void FileEndpoint::drop_direct() {
    int flags = ::fcntl(fd_.get(), F_GETFL);
    if (flags < 0 || ::fcntl(fd_.get(), F_SETFL, flags & ~O_DIRECT) != 0) {
        throw_errno("clear O_DIRECT on '" + path() + "'");
    }
    direct_ = false;
    alignment_ = 1;
    RDD_LOG_INFO("unaligned tail on '%s'; finishing with buffered I/O", path().c_str());
}

} // namespace rdd::detail
