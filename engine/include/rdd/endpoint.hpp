// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 rdd Contributors


/**
 * @file endpoint.hpp
 * @brief Input/output endpoint handles
 */

#ifndef RDD_ENDPOINT_HPP
#define RDD_ENDPOINT_HPP

#include <rdd/fwd.hpp>
#include <rdd/options.hpp>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

namespace rdd {

/// How an endpoint is opened
enum class OpenMode {
    Read,           ///< Read-only
    CreateTruncate, ///< Write-only, create if absent, truncate if present (never append)
    WriteExisting   ///< Write-only onto an existing resource, no create, no truncate
};

/// What the path turned out to be (informational)
enum class ResourceKind { RegularFile, BlockDevice, Other };

/// "file", "block device", "other"
[[nodiscard]] const char *resource_kind_name(ResourceKind kind) noexcept;

/**
 * Endpoint open parameters
 */
struct EndpointOptions {
    std::string path;                 ///< File or device path
    OpenMode mode = OpenMode::Read;   ///< Access mode
    Backend backend = Backend::Posix; ///< I/O backend
    bool direct = false;              ///< Open with O_DIRECT
    std::size_t block_size = 0;       ///< Checked against device alignment when direct (0 = skip)
    std::uint64_t start_offset = 0;   ///< Initial cursor position
};

/**
 * Open input or output resource
 *
 * Owns exactly one OS-level descriptor, released on destruction. Handles
 * are never shared between threads; the sharded engine opens one per
 * shard.
 *
 * Positioned operations (read_at/write_at) are the backend's
 * responsibility. Cursor operations (read/write/seek) are layered on top
 * and never touch the OS cursor, so seeking past end-of-file cannot fail:
 * it only shows up as an empty read.
 *
 * read_at() returns fewer bytes than requested only at end of input.
 * write_at() transfers every byte or throws.
 */
class Endpoint {
  public:
    virtual ~Endpoint() = default;

    // Non-copyable, non-movable (held through unique_ptr)
    Endpoint(const Endpoint &) = delete;
    Endpoint &operator=(const Endpoint &) = delete;
    Endpoint(Endpoint &&) = delete;
    Endpoint &operator=(Endpoint &&) = delete;

    /**
     * Read at an absolute offset
     *
     * @param buf    Destination
     * @param len    Bytes requested
     * @param offset Absolute byte offset
     * @return Bytes read; < len only at end of input, 0 at or past the end
     * @throws Error (kind Io) on failure
     */
    [[nodiscard]] virtual std::size_t read_at(void *buf, std::size_t len, std::uint64_t offset) = 0;

    /**
     * Write at an absolute offset, extending the resource if needed
     *
     * @param buf    Source
     * @param len    Bytes to write
     * @param offset Absolute byte offset
     * @throws Error (kind Io) on failure or if the device stops accepting data
     */
    virtual void write_at(const void *buf, std::size_t len, std::uint64_t offset) = 0;

    /**
     * Force written data to stable storage
     * @throws Error (kind Io) on failure
     */
    virtual void flush() = 0;

    /// Required I/O alignment in bytes (1 unless opened for direct I/O)
    [[nodiscard]] virtual std::size_t alignment() const noexcept = 0;

    /**
     * Current size (file length or device capacity)
     * @throws Error (kind Io) on failure
     */
    [[nodiscard]] virtual std::uint64_t size() const = 0;

    /**
     * Read at the cursor and advance it by the bytes read
     * @return Bytes read (0 at end of input)
     */
    [[nodiscard]] std::size_t read(void *buf, std::size_t len) {
        std::size_t n = read_at(buf, len, position_);
        position_ += n;
        return n;
    }

    /**
     * Write at the cursor and advance it
     */
    void write(const void *buf, std::size_t len) {
        write_at(buf, len, position_);
        position_ += len;
    }

    /**
     * Move the cursor to an absolute offset
     *
     * Performs no I/O.
     *
     * @throws Error (EOVERFLOW) if offset does not fit off_t
     */
    void seek(std::uint64_t offset);

    [[nodiscard]] std::uint64_t position() const noexcept { return position_; }
    [[nodiscard]] const std::string &path() const noexcept { return path_; }
    [[nodiscard]] ResourceKind kind() const noexcept { return kind_; }

  protected:
    Endpoint(std::string path, ResourceKind kind) : path_(std::move(path)), kind_(kind) {}

  private:
    std::string path_;
    ResourceKind kind_;
    std::uint64_t position_ = 0;
};

/**
 * Open an endpoint
 *
 * The backend is selected here; callers only see the Endpoint interface.
 * With direct I/O, the device's logical block size is discovered and
 * opts.block_size is validated against it before the output is truncated;
 * an output file created by this call is removed again if validation
 * fails.
 *
 * @param opts Open parameters
 * @return Open handle, cursor at opts.start_offset
 * @throws Error (kind Io) if the resource cannot be opened,
 *         Error (kind Config) on direct-I/O misalignment
 */
[[nodiscard]] std::unique_ptr<Endpoint> open_endpoint(const EndpointOptions &opts);

} // namespace rdd

#endif // RDD_ENDPOINT_HPP
