// hdrticks
//
// Copyright (c) 2026 VMware, Inc. All Rights Reserved.
//
// This product is licensed to you under the Apache 2.0 license (the "License").
// You may not use this product except in compliance with the Apache 2.0
// License.
//
// This product may include a number of subcomponents with separate copyright
// notices and license terms. Your use of these subcomponents is subject to the
// terms and conditions of the subcomponent's license, as noted in the LICENSE
// file.

#pragma once

#include <cstdint>
#include <utility>
#include <vector>

#include "traversal_cursor.h"

namespace hdrticks::iteration::test {

// A traversal cursor over explicit (value, count) buckets given in increasing value order. Lets the
// tests control bucket contents without going through HdrHistogram's value-to-index mapping.
class VectorTraversalCursor : public TraversalCursor {
 public:
  using Buckets = std::vector<std::pair<int64_t, int64_t>>;

  explicit VectorTraversalCursor(Buckets buckets) : buckets_(std::move(buckets)) { reset(); }

  void reset() override {
    index_ = -1;
    state_ = TraversalState{};
    state_.total_count = currentTotal();
  }

  bool hasNextBucket() const override { return state_.cumulative_count < state_.total_count; }

  bool advance() override {
    if (!hasNextBucket() || index_ + 1 >= static_cast<int64_t>(buckets_.size())) return false;
    ++index_;
    const auto& [value, count] = buckets_[index_];
    state_.count_at_current = count;
    state_.cumulative_count += count;
    state_.value_at_current = value;
    state_.total_value_to_current += count * value;
    return true;
  }

  const TraversalState& state() const override { return state_; }

  bool modified() const override { return currentTotal() != state_.total_count; }

  // Stands in for a value recorded while an iteration is running.
  void addToBucket(size_t index, int64_t count) { buckets_.at(index).second += count; }

 private:
  int64_t currentTotal() const {
    int64_t total = 0;
    for (const auto& bucket : buckets_) total += bucket.second;
    return total;
  }

  Buckets buckets_;
  int64_t index_ = -1;
  TraversalState state_;
};

// One bucket per value in [first, last], each holding `count`.
inline VectorTraversalCursor::Buckets uniformBuckets(int64_t first, int64_t last, int64_t count = 1) {
  VectorTraversalCursor::Buckets buckets;
  for (int64_t v = first; v <= last; ++v) buckets.emplace_back(v, count);
  return buckets;
}

}  // namespace hdrticks::iteration::test
