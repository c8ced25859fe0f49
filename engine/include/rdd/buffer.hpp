// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 rdd Contributors


/**
 * @file buffer.hpp
 * @brief Aligned block buffer for rdd
 */

#ifndef RDD_BUFFER_HPP
#define RDD_BUFFER_HPP

#include <rdd/fwd.hpp>
#include <rdd/error.hpp>

#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <span>

namespace rdd {

/// Default buffer alignment (page size; satisfies O_DIRECT on common devices)
inline constexpr std::size_t DEFAULT_BUFFER_ALIGNMENT = 4096;

/**
 * RAII aligned heap buffer
 *
 * One block-sized buffer is allocated per engine (or per shard) and reused
 * for every read/write cycle. Memory is aligned so the same buffer works
 * with O_DIRECT. Move-only (cannot be copied).
 *
 * Example:
 * @code
 * auto buffer = rdd::Buffer::allocate(1 << 20);
 * size_t n = input.read(buffer.data(), buffer.size());
 * output.write(buffer.data(), n);
 * // buffer freed when it goes out of scope
 * @endcode
 */
class Buffer {
  public:
    /**
     * Default constructor - creates empty buffer
     */
    Buffer() noexcept = default;

    /**
     * Allocate an aligned buffer
     *
     * @param size      Size in bytes (> 0)
     * @param alignment Power-of-two alignment (>= sizeof(void*))
     * @return Owned buffer
     * @throws Error (ENOMEM / EINVAL) on allocation failure
     */
    [[nodiscard]] static Buffer allocate(std::size_t size,
                                         std::size_t alignment = DEFAULT_BUFFER_ALIGNMENT) {
        if (size == 0) {
            throw Error(EINVAL, "Buffer size must be > 0");
        }
        void *ptr = nullptr;
        int rc = posix_memalign(&ptr, alignment, size);
        if (rc != 0) {
            throw Error(rc, "posix_memalign");
        }
        return Buffer(ptr, size);
    }

    /**
     * Move constructor
     */
    Buffer(Buffer &&other) noexcept : ptr_(other.ptr_), size_(other.size_) {
        other.ptr_ = nullptr;
        other.size_ = 0;
    }

    /**
     * Move assignment
     */
    Buffer &operator=(Buffer &&other) noexcept {
        if (this != &other) {
            std::free(ptr_);
            ptr_ = other.ptr_;
            size_ = other.size_;
            other.ptr_ = nullptr;
            other.size_ = 0;
        }
        return *this;
    }

    // Non-copyable
    Buffer(const Buffer &) = delete;
    Buffer &operator=(const Buffer &) = delete;

    ~Buffer() { std::free(ptr_); }

    /**
     * Get buffer data pointer
     * @return Pointer to buffer data
     */
    [[nodiscard]] void *data() noexcept { return ptr_; }

    /**
     * Get buffer data pointer (const)
     * @return Const pointer to buffer data
     */
    [[nodiscard]] const void *data() const noexcept { return ptr_; }

    /**
     * Get buffer size
     * @return Buffer size in bytes
     */
    [[nodiscard]] std::size_t size() const noexcept { return size_; }

    /**
     * Get buffer as span of bytes
     * @return std::span over buffer contents
     * @throws Error if buffer is null
     */
    [[nodiscard]] std::span<std::byte> span() {
        if (!ptr_) {
            throw Error(EINVAL, "Buffer is null");
        }
        return {static_cast<std::byte *>(ptr_), size_};
    }

    /**
     * Get buffer as const span of bytes
     * @return std::span over buffer contents (const)
     * @throws Error if buffer is null
     */
    [[nodiscard]] std::span<const std::byte> span() const {
        if (!ptr_) {
            throw Error(EINVAL, "Buffer is null");
        }
        return {static_cast<const std::byte *>(ptr_), size_};
    }

    /**
     * Check alignment of the data pointer
     * @param alignment Power-of-two alignment
     * @return True if data() is a multiple of alignment
     */
    [[nodiscard]] bool aligned_to(std::size_t alignment) const noexcept {
        return alignment != 0 && reinterpret_cast<std::uintptr_t>(ptr_) % alignment == 0;
    }

    /**
     * Check if buffer is valid (non-null)
     * @return True if buffer has valid data
     */
    [[nodiscard]] explicit operator bool() const noexcept { return ptr_ != nullptr; }

  private:
    Buffer(void *ptr, std::size_t size) noexcept : ptr_(ptr), size_(size) {}

    void *ptr_ = nullptr;
    std::size_t size_ = 0;
};

} // namespace rdd

#endif // RDD_BUFFER_HPP
