// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 rdd Contributors


/**
 * @file digest.cpp
 * @brief Streaming digest backends (OpenSSL SHA-256, BLAKE3)
 */

#include <rdd/buffer.hpp>
#include <rdd/digest.hpp>
#include <rdd/endpoint.hpp>
#include <rdd/error.hpp>

#include "log.h"

#include <algorithm>
#include <cstring>
#include <string>

#include <blake3.h>
#include <openssl/evp.h>

namespace rdd {

/// One hash implementation; chosen once when the Digest is built
class Digest::Hasher {
  public:
    virtual ~Hasher() = default;
    virtual void update(const void *data, std::size_t len) = 0;
    virtual DigestBytes finalize() = 0;
};

namespace {

constexpr std::size_t SHA256_BYTES = 32;

class Sha256Hasher final : public Digest::Hasher {
  public:
    Sha256Hasher() : ctx_(EVP_MD_CTX_new()) {
        if (!ctx_) {
            throw Error(ENOMEM, "EVP_MD_CTX_new");
        }
        if (EVP_DigestInit_ex(ctx_, EVP_sha256(), nullptr) != 1) {
            EVP_MD_CTX_free(ctx_);
            throw Error(ErrorKind::Coordination, EIO, "EVP_DigestInit_ex(sha256)");
        }
    }

    ~Sha256Hasher() override { EVP_MD_CTX_free(ctx_); }

    Sha256Hasher(const Sha256Hasher &) = delete;
    Sha256Hasher &operator=(const Sha256Hasher &) = delete;

    void update(const void *data, std::size_t len) override {
        if (EVP_DigestUpdate(ctx_, data, len) != 1) {
            throw Error(ErrorKind::Coordination, EIO, "EVP_DigestUpdate");
        }
    }

    DigestBytes finalize() override {
        DigestBytes out(EVP_MAX_MD_SIZE);
        unsigned int len = 0;
        if (EVP_DigestFinal_ex(ctx_, out.data(), &len) != 1) {
            throw Error(ErrorKind::Coordination, EIO, "EVP_DigestFinal_ex");
        }
        out.resize(len);
        return out;
    }

  private:
    EVP_MD_CTX *ctx_;
};

class Blake3Hasher final : public Digest::Hasher {
  public:
    Blake3Hasher() { blake3_hasher_init(&hasher_); }

    void update(const void *data, std::size_t len) override {
        blake3_hasher_update(&hasher_, data, len);
    }

    DigestBytes finalize() override {
        DigestBytes out(BLAKE3_OUT_LEN);
        blake3_hasher_finalize(&hasher_, out.data(), out.size());
        return out;
    }

  private:
    blake3_hasher hasher_;
};

int hex_value(char c) noexcept {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // namespace

std::size_t digest_size(HashAlgorithm algo) noexcept {
    switch (algo) {
    case HashAlgorithm::Sha256:
        return SHA256_BYTES;
    case HashAlgorithm::Blake3:
        return BLAKE3_OUT_LEN;
    case HashAlgorithm::None:
    default:
        return 0;
    }
}

Digest::Digest(HashAlgorithm algo) : algo_(algo) {
    switch (algo) {
    case HashAlgorithm::Sha256:
        hasher_ = std::make_unique<Sha256Hasher>();
        break;
    case HashAlgorithm::Blake3:
        hasher_ = std::make_unique<Blake3Hasher>();
        break;
    case HashAlgorithm::None:
    default:
        break;
    }
}

Digest::~Digest() = default;

Digest::Digest(Digest &&other) noexcept = default;
Digest &Digest::operator=(Digest &&other) noexcept = default;

void Digest::update(std::uint64_t offset, const void *data, std::size_t len) {
    if (finalized_) {
        throw Error(ErrorKind::Coordination, EINVAL, "digest update after finalize");
    }
    if (offset != next_offset_) {
        RDD_LOG_ERR("digest update at %llu, expected %llu", (unsigned long long)offset,
                    (unsigned long long)next_offset_);
        throw Error(ErrorKind::Coordination, EINVAL,
                    "out-of-order digest update at offset " + std::to_string(offset) +
                        " (expected " + std::to_string(next_offset_) + ")");
    }
    if (hasher_ && len > 0) {
        hasher_->update(data, len);
    }
    next_offset_ += len;
}

DigestBytes Digest::finalize() {
    if (finalized_) {
        throw Error(ErrorKind::Coordination, EINVAL, "digest finalized twice");
    }
    finalized_ = true;
    if (!hasher_) {
        return {};
    }
    return hasher_->finalize();
}

std::string to_hex(const DigestBytes &digest) {
    static const char digits[] = "0123456789abcdef";
    std::string out;
    out.reserve(digest.size() * 2);
    for (std::uint8_t byte : digest) {
        out.push_back(digits[byte >> 4]);
        out.push_back(digits[byte & 0x0f]);
    }
    return out;
}

DigestBytes parse_hex_digest(std::string_view hex, HashAlgorithm algo) {
    std::size_t want = digest_size(algo);
    if (want == 0) {
        throw config_error("expected digest given without a verification algorithm");
    }
    if (hex.size() != want * 2) {
        throw config_error("expected " + std::string(hash_algorithm_name(algo)) + " digest of " +
                           std::to_string(want * 2) + " hex characters, got " +
                           std::to_string(hex.size()));
    }
    DigestBytes out(want);
    for (std::size_t i = 0; i < want; i++) {
        int hi = hex_value(hex[2 * i]);
        int lo = hex_value(hex[2 * i + 1]);
        if (hi < 0 || lo < 0) {
            throw config_error("expected digest contains a non-hex character");
        }
        out[i] = static_cast<std::uint8_t>((hi << 4) | lo);
    }
    return out;
}

bool digest_equal(const DigestBytes &a, const DigestBytes &b) noexcept {
    if (a.size() != b.size()) {
        return false;
    }
    std::uint8_t diff = 0;
    for (std::size_t i = 0; i < a.size(); i++) {
        diff |= static_cast<std::uint8_t>(a[i] ^ b[i]);
    }
    return diff == 0;
}

DigestBytes hash_range(Endpoint &endpoint, std::uint64_t offset, std::uint64_t length,
                       HashAlgorithm algo, std::size_t block_size, std::uint64_t *hashed) {
    if (algo == HashAlgorithm::None) {
        throw config_error("hash_range requires a digest algorithm");
    }
    if (block_size == 0) {
        throw config_error("hash_range block size must be > 0");
    }

    Digest digest(algo);
    auto buffer =
        Buffer::allocate(block_size, std::max(DEFAULT_BUFFER_ALIGNMENT, endpoint.alignment()));
    std::uint64_t done = 0;
    for (;;) {
        if (length != 0 && done >= length) break;
        // Always read whole blocks so direct-I/O handles see aligned lengths.
        std::size_t n = endpoint.read_at(buffer.data(), block_size, offset + done);
        if (n == 0) break;
        std::size_t use = n;
        if (length != 0) {
            use = static_cast<std::size_t>(std::min<std::uint64_t>(n, length - done));
        }
        digest.update(done, buffer.data(), use);
        done += use;
        if (n < block_size) break;
    }

    RDD_LOG_DEBUG("hashed %llu bytes of '%s' from offset %llu (%s)", (unsigned long long)done,
                  endpoint.path().c_str(), (unsigned long long)offset,
                  hash_algorithm_name(algo));
    if (hashed) {
        *hashed = done;
    }
    return digest.finalize();
}

} // namespace rdd
