#pragma once

// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 Lloyal Labs

/**
 * @file circular_buffer.hpp
 * @brief Fixed-capacity ring buffer
 *
 * Answers "last N items" and "items in the last 60 seconds" without
 * unbounded growth. add() is O(1) and overwrites the oldest item once full;
 * snapshots are returned oldest-first.
 *
 * Thread safety: external synchronization required.
 */

#include <cstddef>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace trellis {

template <typename T>
class CircularBuffer {
public:
  /**
   * @param capacity Maximum number of items held (must be >= 1)
   * @throws std::invalid_argument if capacity < 1
   */
  explicit CircularBuffer(int64_t capacity) {
    if (capacity < 1) {
      throw std::invalid_argument(
          "CircularBuffer capacity must be a positive integer (got " +
          std::to_string(capacity) + ")");
    }
    capacity_ = static_cast<size_t>(capacity);
    items_.reserve(capacity_);
  }

  void add(T item) {
    if (items_.size() < capacity_) {
      items_.push_back(std::move(item));
    } else {
      items_[head_] = std::move(item);
    }
    head_ = (head_ + 1) % capacity_;
  }

  /**
   * Snapshot in insertion order (oldest first)
   *
   * @param limit Keep only the most recent `limit` items (0 = empty)
   */
  std::vector<T> get_all(std::optional<size_t> limit = std::nullopt) const {
    size_t n = items_.size();
    size_t count = n;
    if (limit && *limit < n) {
      count = *limit;
    }

    std::vector<T> out;
    out.reserve(count);
    // Oldest item sits at head_ once the buffer has wrapped, else at 0
    size_t oldest = items_.size() < capacity_ ? 0 : head_;
    for (size_t i = n - count; i < n; ++i) {
      out.push_back(items_[(oldest + i) % n]);
    }
    return out;
  }

  std::optional<T> oldest() const {
    if (items_.empty()) return std::nullopt;
    return items_[items_.size() < capacity_ ? 0 : head_];
  }

  std::optional<T> newest() const {
    if (items_.empty()) return std::nullopt;
    return items_[(head_ + capacity_ - 1) % capacity_];
  }

  void clear() {
    items_.clear();
    head_ = 0;
  }

  size_t size() const { return items_.size(); }
  size_t capacity() const { return capacity_; }
  bool empty() const { return items_.empty(); }
  bool full() const { return items_.size() == capacity_; }

private:
  size_t capacity_ = 0;
  size_t head_ = 0;  // Next write position
  std::vector<T> items_;
};

}  // namespace trellis
