// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 rdd Contributors


/**
 * @file test_digest.cpp
 * @brief Unit tests for the ordered streaming digest
 */

#include "test_harness.hpp"

#include <cctype>

static const char SHA256_EMPTY[] =
    "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855";
static const char SHA256_ABC[] =
    "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad";
static const char BLAKE3_EMPTY[] =
    "af1349b9f5f9a1a6a0404dea36dcc9499bcb25c9adc112b7cc9a93cae41f3262";
static const char BLAKE3_ABC[] =
    "6437b3ac38465133ffb63b75273a8db548c558465d79db03fd359c6cd5bd9d85";

static std::string hex_of(rdd::HashAlgorithm algo, const void *data, std::size_t len) {
    rdd::Digest d(algo);
    d.update(0, data, len);
    return rdd::to_hex(d.finalize());
}

// =============================================================================
// Known vectors
// =============================================================================

TEST(sha256_vectors) {
    ASSERT_EQ(hex_of(rdd::HashAlgorithm::Sha256, "", 0), SHA256_EMPTY);
    ASSERT_EQ(hex_of(rdd::HashAlgorithm::Sha256, "abc", 3), SHA256_ABC);
}

TEST(blake3_vectors) {
    ASSERT_EQ(hex_of(rdd::HashAlgorithm::Blake3, "", 0), BLAKE3_EMPTY);
    ASSERT_EQ(hex_of(rdd::HashAlgorithm::Blake3, "abc", 3), BLAKE3_ABC);
}

TEST(digest_sizes) {
    ASSERT_EQ(rdd::digest_size(rdd::HashAlgorithm::Sha256), 32u);
    ASSERT_EQ(rdd::digest_size(rdd::HashAlgorithm::Blake3), 32u);
    ASSERT_EQ(rdd::digest_size(rdd::HashAlgorithm::None), 0u);
}

// =============================================================================
// Ordering
// =============================================================================

TEST(split_updates_match_single_update) {
    auto data = make_pattern(100000);
    for (auto algo : {rdd::HashAlgorithm::Sha256, rdd::HashAlgorithm::Blake3}) {
        rdd::Digest d(algo);
        std::uint64_t off = 0;
        for (std::size_t chunk : {1u, 4095u, 4096u, 7u, 50000u}) {
            d.update(off, data.data() + off, chunk);
            off += chunk;
        }
        d.update(off, data.data() + off, data.size() - off);
        ASSERT_EQ(d.next_offset(), data.size());
        ASSERT_EQ(rdd::to_hex(d.finalize()), hex_of(algo, data.data(), data.size()));
    }
}

TEST(gap_is_coordination_error) {
    rdd::Digest d(rdd::HashAlgorithm::Sha256);
    d.update(0, "abc", 3);
    ASSERT_THROWS_KIND(d.update(4, "d", 1), rdd::ErrorKind::Coordination);
    // State unchanged: the in-order continuation still works.
    ASSERT_EQ(d.next_offset(), 3u);
    d.update(3, "", 0);
    ASSERT_EQ(rdd::to_hex(d.finalize()), SHA256_ABC);
}

TEST(overlap_is_coordination_error) {
    rdd::Digest d(rdd::HashAlgorithm::Blake3);
    d.update(0, "ab", 2);
    ASSERT_THROWS_KIND(d.update(1, "bc", 2), rdd::ErrorKind::Coordination);
    d.update(2, "c", 1);
    ASSERT_EQ(rdd::to_hex(d.finalize()), BLAKE3_ABC);
}

TEST(finalize_once) {
    rdd::Digest d(rdd::HashAlgorithm::Sha256);
    (void)d.finalize();
    ASSERT(d.finalized());
    ASSERT_THROWS_KIND((void)d.finalize(), rdd::ErrorKind::Coordination);
    ASSERT_THROWS_KIND(d.update(0, "x", 1), rdd::ErrorKind::Coordination);
}

TEST(none_is_noop_but_still_ordered) {
    rdd::Digest d(rdd::HashAlgorithm::None);
    ASSERT(!d.enabled());
    d.update(0, "abc", 3);
    ASSERT_THROWS_KIND(d.update(0, "abc", 3), rdd::ErrorKind::Coordination);
    ASSERT(d.finalize().empty());
}

TEST(digest_movable) {
    rdd::Digest a(rdd::HashAlgorithm::Sha256);
    a.update(0, "a", 1);
    rdd::Digest b(std::move(a));
    b.update(1, "bc", 2);
    ASSERT_EQ(rdd::to_hex(b.finalize()), SHA256_ABC);
}

// =============================================================================
// Hex parsing and comparison
// =============================================================================

TEST(parse_hex_accepts_both_cases) {
    auto lower = rdd::parse_hex_digest(SHA256_ABC, rdd::HashAlgorithm::Sha256);
    std::string upper_text(SHA256_ABC);
    for (auto &c : upper_text) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    auto upper = rdd::parse_hex_digest(upper_text, rdd::HashAlgorithm::Sha256);
    ASSERT(rdd::digest_equal(lower, upper));
    ASSERT_EQ(rdd::to_hex(lower), SHA256_ABC);
}

TEST(parse_hex_rejects_bad_input) {
    ASSERT_THROWS_KIND((void)rdd::parse_hex_digest("abcd", rdd::HashAlgorithm::Sha256),
                       rdd::ErrorKind::Config);
    std::string bad(SHA256_ABC);
    bad[10] = 'g';
    ASSERT_THROWS_KIND((void)rdd::parse_hex_digest(bad, rdd::HashAlgorithm::Sha256),
                       rdd::ErrorKind::Config);
    ASSERT_THROWS_KIND((void)rdd::parse_hex_digest(SHA256_ABC, rdd::HashAlgorithm::None),
                       rdd::ErrorKind::Config);
}

TEST(digest_equal_bytewise) {
    auto a = rdd::parse_hex_digest(SHA256_ABC, rdd::HashAlgorithm::Sha256);
    auto b = a;
    ASSERT(rdd::digest_equal(a, b));
    b[31] ^= 1;
    ASSERT(!rdd::digest_equal(a, b));
    b.pop_back();
    ASSERT(!rdd::digest_equal(a, b));
}

// =============================================================================
// hash_range
// =============================================================================

TEST(hash_range_matches_in_memory) {
    TempFile file(70000);
    rdd::EndpointOptions opts;
    opts.path = file.path();
    auto ep = rdd::open_endpoint(opts);

    std::uint64_t hashed = 0;
    auto whole = rdd::hash_range(*ep, 0, 0, rdd::HashAlgorithm::Sha256, 4096, &hashed);
    ASSERT_EQ(hashed, 70000u);
    ASSERT_EQ(rdd::to_hex(whole),
              hex_of(rdd::HashAlgorithm::Sha256, file.data().data(), file.data().size()));

    auto part = rdd::hash_range(*ep, 1000, 5000, rdd::HashAlgorithm::Blake3, 4096, &hashed);
    ASSERT_EQ(hashed, 5000u);
    ASSERT_EQ(rdd::to_hex(part),
              hex_of(rdd::HashAlgorithm::Blake3, file.data().data() + 1000, 5000));

    // Length beyond the end stops at end of input.
    (void)rdd::hash_range(*ep, 69000, 10000, rdd::HashAlgorithm::Blake3, 4096, &hashed);
    ASSERT_EQ(hashed, 1000u);
}

TEST(hash_range_requires_algorithm) {
    TempFile file(16);
    rdd::EndpointOptions opts;
    opts.path = file.path();
    auto ep = rdd::open_endpoint(opts);
    ASSERT_THROWS_KIND((void)rdd::hash_range(*ep, 0, 0, rdd::HashAlgorithm::None, 4096),
                       rdd::ErrorKind::Config);
}

int main() {
    printf("Running digest tests...\n");

    RUN_TEST(sha256_vectors);
    RUN_TEST(blake3_vectors);
    RUN_TEST(digest_sizes);
    RUN_TEST(split_updates_match_single_update);
    RUN_TEST(gap_is_coordination_error);
    RUN_TEST(overlap_is_coordination_error);
    RUN_TEST(finalize_once);
    RUN_TEST(none_is_noop_but_still_ordered);
    RUN_TEST(digest_movable);
    RUN_TEST(parse_hex_accepts_both_cases);
    RUN_TEST(parse_hex_rejects_bad_input);
    RUN_TEST(digest_equal_bytewise);
    RUN_TEST(hash_range_matches_in_memory);
    RUN_TEST(hash_range_requires_algorithm);

    TEST_SUMMARY();
    return tests_failed > 0 ? 1 : 0;
}
