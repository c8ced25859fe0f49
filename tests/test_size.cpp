// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 rdd Contributors


/**
 * @file test_size.cpp
 * @brief Unit tests for size string parsing and formatting
 */

#include "test_harness.hpp"

#include <limits>

static rdd::SizeError cause_of(std::string_view text) {
    try {
        (void)rdd::parse_size(text);
    } catch (const rdd::SizeParseError &e) {
        return e.cause();
    }
    throw std::runtime_error("parse_size accepted '" + std::string(text) + "'");
}

// =============================================================================
// Parsing
// =============================================================================

TEST(plain_bytes) {
    ASSERT_EQ(rdd::parse_size("0"), 0u);
    ASSERT_EQ(rdd::parse_size("512"), 512u);
    ASSERT_EQ(rdd::parse_size("18446744073709551615"), std::numeric_limits<std::uint64_t>::max());
}

TEST(binary_suffixes) {
    ASSERT_EQ(rdd::parse_size("1k"), 1024u);
    ASSERT_EQ(rdd::parse_size("4kb"), 4096u);
    ASSERT_EQ(rdd::parse_size("1m"), 1024u * 1024u);
    ASSERT_EQ(rdd::parse_size("3MB"), 3u * 1024u * 1024u);
    ASSERT_EQ(rdd::parse_size("2G"), 2147483648ULL);
    ASSERT_EQ(rdd::parse_size("1gb"), 1073741824ULL);
    ASSERT_EQ(rdd::parse_size("1T"), 1099511627776ULL);
    ASSERT_EQ(rdd::parse_size("2tB"), 2 * 1099511627776ULL);
}

TEST(case_and_whitespace) {
    ASSERT_EQ(rdd::parse_size("  512K  "), 512u * 1024u);
    ASSERT_EQ(rdd::parse_size("\t8Kb\n"), 8u * 1024u);
    ASSERT_EQ(rdd::parse_size("1mB"), rdd::parse_size("1MB"));
}

TEST(suffix_scaling_matches_multiplier) {
    const std::uint64_t mults[] = {1024ULL, 1024ULL * 1024, 1024ULL * 1024 * 1024};
    const char *suffixes[] = {"k", "m", "g"};
    for (std::uint64_t n : {1ULL, 7ULL, 100ULL, 4095ULL}) {
        for (int i = 0; i < 3; i++) {
            std::string text = std::to_string(n) + suffixes[i];
            ASSERT_EQ(rdd::parse_size(text), n * mults[i]);
        }
    }
}

TEST(empty_is_rejected) {
    ASSERT(cause_of("") == rdd::SizeError::Empty);
    ASSERT(cause_of("   ") == rdd::SizeError::Empty);
}

TEST(invalid_number) {
    ASSERT(cause_of("abc") == rdd::SizeError::InvalidNumber);
    ASSERT(cause_of("k") == rdd::SizeError::InvalidNumber);
    ASSERT(cause_of("-5") == rdd::SizeError::InvalidNumber);
    ASSERT(cause_of("99999999999999999999") == rdd::SizeError::InvalidNumber);
}

TEST(unknown_suffix) {
    ASSERT(cause_of("12x") == rdd::SizeError::UnknownSuffix);
    ASSERT(cause_of("1.5M") == rdd::SizeError::UnknownSuffix);
    ASSERT(cause_of("4kib") == rdd::SizeError::UnknownSuffix);
    ASSERT(cause_of("10 M") == rdd::SizeError::UnknownSuffix);
    ASSERT(cause_of("1p") == rdd::SizeError::UnknownSuffix);
}

TEST(multiplier_overflow) {
    ASSERT(cause_of("999999999999T") == rdd::SizeError::Overflow);
    ASSERT(cause_of("18446744073709551615k") == rdd::SizeError::Overflow);
    ASSERT_EQ(rdd::parse_size("16777215T"), 16777215ULL * 1099511627776ULL);
}

TEST(errors_are_config_class) {
    try {
        (void)rdd::parse_size("999999999999T");
        ASSERT(false);
    } catch (const rdd::Error &e) {
        ASSERT(e.is_config());
        ASSERT(e.is_overflow());
    }
    try {
        (void)rdd::parse_size("bogus");
        ASSERT(false);
    } catch (const rdd::Error &e) {
        ASSERT(e.is_config());
        ASSERT(e.is_invalid());
    }
    // Also catchable as std::system_error
    ASSERT_THROWS((void)rdd::parse_size(""), std::system_error);
}

TEST(size_error_names) {
    ASSERT_EQ(std::string(rdd::size_error_name(rdd::SizeError::Empty)), "empty size");
    ASSERT_EQ(std::string(rdd::size_error_name(rdd::SizeError::Overflow)), "overflow");
}

TEST(parse_count_plain_digits) {
    ASSERT_EQ(rdd::parse_count("0", "count"), 0u);
    ASSERT_EQ(rdd::parse_count(" 42 ", "count"), 42u);
    ASSERT_THROWS_KIND((void)rdd::parse_count("4k", "count"), rdd::ErrorKind::Config);
    ASSERT_THROWS_KIND((void)rdd::parse_count("", "skip"), rdd::ErrorKind::Config);
}

// =============================================================================
// Formatting
// =============================================================================

TEST(format_bytes_units) {
    ASSERT_EQ(rdd::format_bytes(0), "0 B");
    ASSERT_EQ(rdd::format_bytes(512), "512 B");
    ASSERT_EQ(rdd::format_bytes(1536), "1.5 KiB");
    ASSERT_EQ(rdd::format_bytes(10.0 * 1024 * 1024), "10.0 MiB");
    ASSERT_EQ(rdd::format_bytes(2.0 * 1024 * 1024 * 1024), "2.0 GiB");
    ASSERT_EQ(rdd::format_bytes(3.0 * 1024 * 1024 * 1024 * 1024), "3.0 TiB");
}

TEST(format_rate_units) {
    ASSERT_EQ(rdd::format_rate(100), "100 B/s");
    ASSERT_EQ(rdd::format_rate(120.0 * 1024 * 1024), "120.0 MiB/s");
}

// =============================================================================
// Main
// =============================================================================

int main() {
    printf("Running size tests...\n");

    RUN_TEST(plain_bytes);
    RUN_TEST(binary_suffixes);
    RUN_TEST(case_and_whitespace);
    RUN_TEST(suffix_scaling_matches_multiplier);
    RUN_TEST(empty_is_rejected);
    RUN_TEST(invalid_number);
    RUN_TEST(unknown_suffix);
    RUN_TEST(multiplier_overflow);
    RUN_TEST(errors_are_config_class);
    RUN_TEST(size_error_names);
    RUN_TEST(parse_count_plain_digits);
    RUN_TEST(format_bytes_units);
    RUN_TEST(format_rate_units);

    TEST_SUMMARY();
    return tests_failed > 0 ? 1 : 0;
}
