// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 rdd Contributors


/**
 * @file options.hpp
 * @brief Job options builder for rdd
 */

#ifndef RDD_OPTIONS_HPP
#define RDD_OPTIONS_HPP

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace rdd {

/// Default block size (matches the classic 512k default of the tool)
inline constexpr std::size_t DEFAULT_BLOCK_SIZE = 512 * 1024;

/// Upper bound on worker threads
inline constexpr unsigned MAX_THREADS = 255;

/// Default progress sampling interval
inline constexpr std::uint32_t DEFAULT_PROGRESS_INTERVAL_MS = 200;

/**
 * Verification algorithm
 *
 * Selected once per job; the digest backend is chosen at construction.
 */
enum class HashAlgorithm {
    None,   ///< No verification
    Sha256, ///< SHA-256 (OpenSSL EVP)
    Blake3  ///< BLAKE3
};

/// "none", "sha256", "blake3"
[[nodiscard]] const char *hash_algorithm_name(HashAlgorithm algo) noexcept;

/**
 * Parse an algorithm name (case-insensitive)
 * @throws Error (kind Config) for unknown names
 */
[[nodiscard]] HashAlgorithm parse_hash_algorithm(std::string_view name);

/**
 * Endpoint I/O backend
 *
 * Controls how endpoint handles move bytes. Chosen at open time; the copy
 * engines never inspect it.
 */
enum class Backend {
    Posix, ///< pread/pwrite/fdatasync (default)
    Uring  ///< Private io_uring ring per handle
};

/// "posix", "uring"
[[nodiscard]] const char *backend_name(Backend backend) noexcept;

/**
 * Parse a backend name (case-insensitive)
 * @throws Error (kind Config) for unknown names
 */
[[nodiscard]] Backend parse_backend(std::string_view name);

/**
 * Copy job configuration
 *
 * Uses builder pattern for fluent configuration. Nothing is validated
 * here; JobDescriptor::from_options() does that.
 *
 * Example:
 * @code
 * rdd::JobOptions opts;
 * opts.input("/dev/sdb")
 *     .output("disk.img")
 *     .block_size("4M")
 *     .threads(4)
 *     .verify(rdd::HashAlgorithm::Blake3);
 *
 * auto result = rdd::run_job(rdd::JobDescriptor::from_options(opts));
 * @endcode
 */
class JobOptions {
  public:
    JobOptions() = default;

    /**
     * Set input file or device
     * @param path Input path
     * @return Reference to this for chaining
     */
    JobOptions &input(std::string path) {
        input_ = std::move(path);
        return *this;
    }

    /**
     * Set output file or device
     * @param path Output path (created/truncated)
     * @return Reference to this for chaining
     */
    JobOptions &output(std::string path) {
        output_ = std::move(path);
        return *this;
    }

    /**
     * Set block size in bytes
     * @param bytes Block size (must be > 0, checked at validation)
     * @return Reference to this for chaining
     */
    JobOptions &block_size(std::size_t bytes) noexcept {
        block_size_ = bytes;
        return *this;
    }

    /**
     * Set block size from a size string ("4k", "1M", ...)
     * @param text Size string
     * @return Reference to this for chaining
     * @throws SizeParseError on malformed input
     */
    JobOptions &block_size(std::string_view text);

    /**
     * Set number of blocks to copy
     * @param blocks Block count (0 = until end of input)
     * @return Reference to this for chaining
     */
    JobOptions &count(std::uint64_t blocks) noexcept {
        count_ = blocks;
        return *this;
    }

    /**
     * Skip blocks at the start of the input
     * @param blocks Blocks of block_size to skip
     * @return Reference to this for chaining
     */
    JobOptions &skip(std::uint64_t blocks) noexcept {
        skip_ = blocks;
        return *this;
    }

    /**
     * Seek blocks at the start of the output
     * @param blocks Blocks of block_size to seek
     * @return Reference to this for chaining
     */
    JobOptions &seek(std::uint64_t blocks) noexcept {
        seek_ = blocks;
        return *this;
    }

    /**
     * Set worker thread count
     * @param count 1 = single-path engine, >1 = sharded engine
     * @return Reference to this for chaining
     */
    JobOptions &threads(unsigned count) noexcept {
        threads_ = count;
        return *this;
    }

    /**
     * Set verification algorithm
     * @param algo Digest algorithm (None disables verification)
     * @return Reference to this for chaining
     */
    JobOptions &verify(HashAlgorithm algo) noexcept {
        verify_ = algo;
        return *this;
    }

    /**
     * Set expected digest of the copied region
     * @param hex Hex digest (either case; empty = none)
     * @return Reference to this for chaining
     */
    JobOptions &expect_digest(std::string hex) {
        expect_ = std::move(hex);
        return *this;
    }

    /**
     * Re-read the output after the flush and compare digests
     * @param enable True to enable read-back verification
     * @return Reference to this for chaining
     */
    JobOptions &readback(bool enable = true) noexcept {
        readback_ = enable;
        return *this;
    }

    /**
     * Bypass the page cache (O_DIRECT)
     *
     * Block size must be a multiple of the device's logical block size;
     * checked when the endpoints are opened.
     *
     * @param enable True to enable direct I/O
     * @return Reference to this for chaining
     */
    JobOptions &direct(bool enable = true) noexcept {
        direct_ = enable;
        return *this;
    }

    /**
     * Enable progress sampling
     * @param enable True to deliver progress samples
     * @return Reference to this for chaining
     */
    JobOptions &progress(bool enable = true) noexcept {
        progress_ = enable;
        return *this;
    }

    /**
     * Set progress sampling interval
     * @param ms Interval in milliseconds
     * @return Reference to this for chaining
     */
    JobOptions &progress_interval_ms(std::uint32_t ms) noexcept {
        progress_interval_ms_ = ms;
        return *this;
    }

    /**
     * Set endpoint backend
     * @param backend I/O backend (default: Posix)
     * @return Reference to this for chaining
     */
    JobOptions &backend(Backend backend) noexcept {
        backend_ = backend;
        return *this;
    }

    /**
     * Set blocks per range claim in the sharded engine
     * @param blocks Blocks per claim (0 = auto)
     * @return Reference to this for chaining
     */
    JobOptions &claim_blocks(std::size_t blocks) noexcept {
        claim_blocks_ = blocks;
        return *this;
    }

    // Getters
    [[nodiscard]] const std::string &input() const noexcept { return input_; }
    [[nodiscard]] const std::string &output() const noexcept { return output_; }
    [[nodiscard]] std::size_t block_size() const noexcept { return block_size_; }
    [[nodiscard]] std::uint64_t count() const noexcept { return count_; }
    [[nodiscard]] std::uint64_t skip() const noexcept { return skip_; }
    [[nodiscard]] std::uint64_t seek() const noexcept { return seek_; }
    [[nodiscard]] unsigned threads() const noexcept { return threads_; }
    [[nodiscard]] HashAlgorithm verify() const noexcept { return verify_; }
    [[nodiscard]] const std::string &expect_digest() const noexcept { return expect_; }
    [[nodiscard]] bool readback() const noexcept { return readback_; }
    [[nodiscard]] bool direct() const noexcept { return direct_; }
    [[nodiscard]] bool progress() const noexcept { return progress_; }
    [[nodiscard]] std::uint32_t progress_interval_ms() const noexcept {
        return progress_interval_ms_;
    }
    [[nodiscard]] Backend backend() const noexcept { return backend_; }
    [[nodiscard]] std::size_t claim_blocks() const noexcept { return claim_blocks_; }

  private:
    std::string input_;
    std::string output_;
    std::size_t block_size_ = DEFAULT_BLOCK_SIZE;
    std::uint64_t count_ = 0;
    std::uint64_t skip_ = 0;
    std::uint64_t seek_ = 0;
    unsigned threads_ = 1;
    HashAlgorithm verify_ = HashAlgorithm::None;
    std::string expect_;
    bool readback_ = false;
    bool direct_ = false;
    bool progress_ = true;
    std::uint32_t progress_interval_ms_ = DEFAULT_PROGRESS_INTERVAL_MS;
    Backend backend_ = Backend::Posix;
    std::size_t claim_blocks_ = 0;
};

} // namespace rdd

#endif // RDD_OPTIONS_HPP
