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

namespace hdrticks::iteration {

// What a traversal engine exposes about the bucket it is positioned at.
struct TraversalState {
  // Total count across the histogram. Fixed for the duration of a traversal.
  int64_t total_count = 0;
  // Count through the current bucket, inclusive.
  int64_t cumulative_count = 0;
  // Count recorded exactly at the current bucket.
  int64_t count_at_current = 0;
  // The highest value equivalent to the current bucket.
  int64_t value_at_current = 0;
  // Sum of count * value over all buckets visited so far, modulo 2^64.
  int64_t total_value_to_current = 0;
};

// A cursor walking the buckets of a histogram in increasing value order, one bucket per advance().
// Before the first advance() the cursor is positioned ahead of the first bucket and reports zero
// counts.
//
// A cursor is owned by a single iteration session and is not thread safe.
class TraversalCursor {
 public:
  virtual ~TraversalCursor() = default;

  // Rewind to the start of the histogram, re-reading its total count.
  virtual void reset() = 0;

  // True while the cumulative count is below the total count, i.e. there are recorded values in
  // buckets not visited yet.
  virtual bool hasNextBucket() const = 0;

  // Move to the next bucket. Returns false, without moving, when there is none.
  virtual bool advance() = 0;

  virtual const TraversalState& state() const = 0;

  // True if the underlying histogram's total count no longer matches the one captured at reset().
  virtual bool modified() const = 0;
};

}  // namespace hdrticks::iteration
