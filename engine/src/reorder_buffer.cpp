// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 rdd Contributors


/**
 * @file reorder_buffer.cpp
 * @brief Bounded offset-ordered handoff from shards to the digest
 */

#include "reorder_buffer.h"

#include <cstring>

namespace rdd::detail {

ReorderBuffer::ReorderBuffer(std::uint64_t window_bytes, unsigned producers)
    : window_(window_bytes), producers_left_(producers) {}

bool ReorderBuffer::admissible(std::uint64_t offset) const noexcept {
    return offset == next_ || offset - next_ < window_;
}

bool ReorderBuffer::push(std::uint64_t offset, const void *data, std::size_t len) {
    std::unique_lock<std::mutex> guard(lock_);
    space_cv_.wait(guard, [&] { return aborted_ || admissible(offset); });
    if (aborted_) {
        return false;
    }

    std::vector<std::uint8_t> bytes;
    if (!spare_.empty()) {
        bytes = std::move(spare_.back());
        spare_.pop_back();
    }
    // Copy outside the lock; the slot is ours once reserved in held_.
    auto slot = held_.emplace(offset, std::vector<std::uint8_t>()).first;
    guard.unlock();

    bytes.resize(len);
    std::memcpy(bytes.data(), data, len);

    guard.lock();
    slot->second = std::move(bytes);
    bool wake = offset == next_;
    guard.unlock();
    if (wake) {
        data_cv_.notify_one();
    }
    return true;
}

void ReorderBuffer::producer_done() {
    {
        std::lock_guard<std::mutex> guard(lock_);
        if (producers_left_ > 0) producers_left_--;
    }
    data_cv_.notify_one();
}

ReorderBuffer::PopStatus ReorderBuffer::pop(ReorderEntry &entry, std::chrono::milliseconds wait) {
    std::unique_lock<std::mutex> guard(lock_);
    auto ready = [&] {
        if (aborted_) return true;
        auto it = held_.find(next_);
        if (it != held_.end() && it->second.size() > 0) return true;
        return producers_left_ == 0;
    };
    if (!data_cv_.wait_for(guard, wait, ready)) {
        return PopStatus::Timeout;
    }
    if (aborted_) {
        return PopStatus::Aborted;
    }

    auto it = held_.find(next_);
    if (it != held_.end() && it->second.size() > 0) {
        entry.offset = it->first;
        entry.bytes = std::move(it->second);
        held_.erase(it);
        next_ += entry.bytes.size();
        guard.unlock();
        space_cv_.notify_all();
        return PopStatus::Ready;
    }
    return held_.empty() ? PopStatus::Drained : PopStatus::Gap;
}

void ReorderBuffer::recycle(std::vector<std::uint8_t> &&bytes) {
    std::lock_guard<std::mutex> guard(lock_);
    spare_.push_back(std::move(bytes));
}

void ReorderBuffer::abort() {
    {
        std::lock_guard<std::mutex> guard(lock_);
        aborted_ = true;
    }
    space_cv_.notify_all();
    data_cv_.notify_all();
}

std::uint64_t ReorderBuffer::next_offset() const {
    std::lock_guard<std::mutex> guard(lock_);
    return next_;
}

std::size_t ReorderBuffer::pending() const {
    std::lock_guard<std::mutex> guard(lock_);
    return held_.size();
}

} // namespace rdd::detail
