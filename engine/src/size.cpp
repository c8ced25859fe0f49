// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 rdd Contributors


/**
 * @file size.cpp
 * @brief Size string parsing and formatting
 */

#include <rdd/size.hpp>

#include "internal.h"

#include <cctype>
#include <cstdio>
#include <limits>

namespace rdd {

namespace {

constexpr std::uint64_t KIB = 1024ULL;

std::string_view trim(std::string_view s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
    return s;
}

std::string quoted(std::string_view s) {
    std::string out;
    out.reserve(s.size() + 2);
    out += '\'';
    out.append(s);
    out += '\'';
    return out;
}

// False on empty input, non-digits or 64-bit overflow.
bool parse_digits(std::string_view digits, std::uint64_t &out) {
    if (digits.empty()) return false;
    std::uint64_t value = 0;
    for (char c : digits) {
        if (c < '0' || c > '9') return false;
        if (!detail::checked_mul(value, 10, value)) return false;
        if (!detail::checked_add(value, static_cast<std::uint64_t>(c - '0'), value)) return false;
    }
    out = value;
    return true;
}

bool suffix_multiplier(std::string_view suffix, std::uint64_t &mult) {
    if (suffix.empty()) {
        mult = 1;
        return true;
    }
    char unit = static_cast<char>(std::tolower(static_cast<unsigned char>(suffix[0])));
    if (suffix.size() == 2) {
        if (std::tolower(static_cast<unsigned char>(suffix[1])) != 'b') return false;
    } else if (suffix.size() > 2) {
        return false;
    }
    switch (unit) {
    case 'k':
        mult = KIB;
        return true;
    case 'm':
        mult = KIB * KIB;
        return true;
    case 'g':
        mult = KIB * KIB * KIB;
        return true;
    case 't':
        mult = KIB * KIB * KIB * KIB;
        return true;
    default:
        return false;
    }
}

std::string format_scaled(double value, const char *unit_suffix) {
    char buf[48];
    if (value >= 1024.0 * 1024.0 * 1024.0 * 1024.0)
        std::snprintf(buf, sizeof(buf), "%.1f TiB%s", value / (1024.0 * 1024.0 * 1024.0 * 1024.0),
                      unit_suffix);
    else if (value >= 1024.0 * 1024.0 * 1024.0)
        std::snprintf(buf, sizeof(buf), "%.1f GiB%s", value / (1024.0 * 1024.0 * 1024.0),
                      unit_suffix);
    else if (value >= 1024.0 * 1024.0)
        std::snprintf(buf, sizeof(buf), "%.1f MiB%s", value / (1024.0 * 1024.0), unit_suffix);
    else if (value >= 1024.0)
        std::snprintf(buf, sizeof(buf), "%.1f KiB%s", value / 1024.0, unit_suffix);
    else std::snprintf(buf, sizeof(buf), "%.0f B%s", value, unit_suffix);
    return buf;
}

} // namespace

const char *size_error_name(SizeError cause) noexcept {
    switch (cause) {
    case SizeError::Empty:
        return "empty size";
    case SizeError::InvalidNumber:
        return "invalid number";
    case SizeError::UnknownSuffix:
        return "unknown suffix";
    case SizeError::Overflow:
        return "overflow";
    case SizeError::ExceedsAddressSpace:
        return "exceeds address space";
    default:
        return "???";
    }
}

std::size_t parse_size(std::string_view text) {
    std::string_view s = trim(text);
    if (s.empty()) {
        throw SizeParseError(SizeError::Empty, "size string cannot be empty");
    }

    std::size_t split = 0;
    while (split < s.size() && s[split] >= '0' && s[split] <= '9') split++;
    std::string_view digits = s.substr(0, split);
    std::string_view suffix = s.substr(split);

    std::uint64_t number = 0;
    if (!parse_digits(digits, number)) {
        throw SizeParseError(SizeError::InvalidNumber,
                             "invalid numeric value in size " + quoted(s));
    }

    std::uint64_t mult = 1;
    if (!suffix_multiplier(suffix, mult)) {
        throw SizeParseError(SizeError::UnknownSuffix, "unknown size suffix " + quoted(suffix));
    }

    std::uint64_t bytes = 0;
    if (!detail::checked_mul(number, mult, bytes)) {
        throw SizeParseError(SizeError::Overflow,
                             "size " + quoted(s) + " is too large and would overflow");
    }

    if (bytes > std::numeric_limits<std::size_t>::max()) {
        throw SizeParseError(SizeError::ExceedsAddressSpace,
                             "size " + quoted(s) + " is too large for this system's address space");
    }
    return static_cast<std::size_t>(bytes);
}

std::uint64_t parse_count(std::string_view text, std::string_view what) {
    std::string_view s = trim(text);
    if (s.empty()) {
        throw SizeParseError(SizeError::Empty, std::string(what) + " cannot be empty");
    }
    std::uint64_t value = 0;
    if (!parse_digits(s, value)) {
        throw SizeParseError(SizeError::InvalidNumber,
                             "invalid " + std::string(what) + " " + quoted(s));
    }
    return value;
}

std::string format_bytes(double bytes) {
    return format_scaled(bytes, "");
}

std::string format_rate(double bytes_per_sec) {
    return format_scaled(bytes_per_sec, "/s");
}

} // namespace rdd
