// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 rdd Contributors


/**
 * @file digest.hpp
 * @brief Ordered streaming digest over the copied region
 */

#ifndef RDD_DIGEST_HPP
#define RDD_DIGEST_HPP

#include <rdd/fwd.hpp>
#include <rdd/options.hpp>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace rdd {

/// Raw digest bytes
using DigestBytes = std::vector<std::uint8_t>;

/**
 * Get digest width for an algorithm
 * @return Width in bytes (0 for HashAlgorithm::None)
 */
[[nodiscard]] std::size_t digest_size(HashAlgorithm algo) noexcept;

/**
 * Incremental digest fed in logical byte order
 *
 * Offsets are relative to the start of the copied region, not the file.
 * Every update must start exactly where the previous one ended; anything
 * else is an engine bug and is rejected instead of silently hashing a
 * reordered stream.
 *
 * The hash implementation is chosen once in the constructor. Move-only.
 *
 * Example:
 * @code
 * rdd::Digest digest(rdd::HashAlgorithm::Sha256);
 * digest.update(0, buf, 4096);
 * digest.update(4096, buf2, 100);
 * std::string hex = rdd::to_hex(digest.finalize());
 * @endcode
 */
class Digest {
  public:
    /**
     * Create a digest context
     * @param algo Algorithm (None yields a no-op context)
     * @throws Error if the hash library cannot allocate a context
     */
    explicit Digest(HashAlgorithm algo);

    ~Digest();

    Digest(Digest &&other) noexcept;
    Digest &operator=(Digest &&other) noexcept;

    // Non-copyable
    Digest(const Digest &) = delete;
    Digest &operator=(const Digest &) = delete;

    /**
     * Fold the next byte range into the digest
     *
     * @param offset Logical offset of data; must equal next_offset()
     * @param data   Bytes
     * @param len    Byte count
     * @throws Error (kind Coordination) on a gap, overlap or update after finalize()
     */
    void update(std::uint64_t offset, const void *data, std::size_t len);

    /**
     * Finish the digest
     *
     * May be called once.
     *
     * @return Raw digest (empty for HashAlgorithm::None)
     * @throws Error (kind Coordination) if already finalized
     */
    [[nodiscard]] DigestBytes finalize();

    /// Offset the next update() must start at
    [[nodiscard]] std::uint64_t next_offset() const noexcept { return next_offset_; }

    [[nodiscard]] HashAlgorithm algorithm() const noexcept { return algo_; }
    [[nodiscard]] bool finalized() const noexcept { return finalized_; }

    /// True unless constructed with HashAlgorithm::None
    [[nodiscard]] bool enabled() const noexcept { return algo_ != HashAlgorithm::None; }

    /// Hash implementation interface (one per algorithm)
    class Hasher;

  private:
    HashAlgorithm algo_;
    std::unique_ptr<Hasher> hasher_;
    std::uint64_t next_offset_ = 0;
    bool finalized_ = false;
};

/// Lowercase hex of a raw digest
[[nodiscard]] std::string to_hex(const DigestBytes &digest);

/**
 * Parse a hex digest supplied by the user
 *
 * @param hex  Hex text, either case
 * @param algo Algorithm the digest belongs to (fixes the width)
 * @return Decoded bytes
 * @throws Error (kind Config) on wrong length or non-hex characters
 */
[[nodiscard]] DigestBytes parse_hex_digest(std::string_view hex, HashAlgorithm algo);

/// Byte-wise comparison; does not exit early on the first difference
[[nodiscard]] bool digest_equal(const DigestBytes &a, const DigestBytes &b) noexcept;

/**
 * Digest a byte range of an open endpoint
 *
 * Independent reference computation used for read-back verification.
 *
 * @param endpoint   Open, readable endpoint
 * @param offset     Absolute start offset
 * @param length     Bytes to hash (0 = until end of input)
 * @param algo       Algorithm (must not be None)
 * @param block_size Read granularity
 * @param hashed     If non-null, receives the number of bytes actually hashed
 * @return Raw digest
 * @throws Error on I/O failure or HashAlgorithm::None
 */
[[nodiscard]] DigestBytes hash_range(Endpoint &endpoint, std::uint64_t offset,
                                     std::uint64_t length, HashAlgorithm algo,
                                     std::size_t block_size, std::uint64_t *hashed = nullptr);

} // namespace rdd

#endif // RDD_DIGEST_HPP
