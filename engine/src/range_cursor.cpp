// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 rdd Contributors


/**
 * @file range_cursor.cpp
 * @brief Block range planning for the sharded engine
 */

#include "range_cursor.h"

#include <algorithm>

namespace rdd::detail {

std::vector<BlockRange> partition_blocks(std::uint64_t total, unsigned shards) {
    std::vector<BlockRange> ranges;
    if (total == 0 || shards == 0) {
        return ranges;
    }
    std::uint64_t n = std::min<std::uint64_t>(shards, total);
    std::uint64_t per = total / n;
    ranges.reserve(n);
    for (std::uint64_t i = 0; i < n; i++) {
        BlockRange r;
        r.first = i * per;
        r.count = (i == n - 1) ? total - r.first : per;
        ranges.push_back(r);
    }
    return ranges;
}

RangeCursor::RangeCursor(std::uint64_t limit_blocks, std::size_t claim_blocks) noexcept
    : end_(limit_blocks > 0 ? limit_blocks : UNBOUNDED),
      claim_blocks_(claim_blocks > 0 ? claim_blocks : 1) {}

std::optional<BlockRange> RangeCursor::claim() {
    std::lock_guard<std::mutex> guard(lock_);
    if (next_ >= end_) {
        return std::nullopt;
    }
    BlockRange r;
    r.first = next_;
    r.count = std::min<std::uint64_t>(claim_blocks_, end_ - next_);
    next_ += r.count;
    claims_++;
    return r;
}

void RangeCursor::report_eof(std::uint64_t block) noexcept {
    std::lock_guard<std::mutex> guard(lock_);
    end_ = std::min(end_, block);
}

std::uint64_t RangeCursor::end() const {
    std::lock_guard<std::mutex> guard(lock_);
    return end_;
}

std::uint64_t RangeCursor::claims() const {
    std::lock_guard<std::mutex> guard(lock_);
    return claims_;
}

} // namespace rdd::detail
