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
#include <memory>

#include <hdr/hdr_histogram.h>

#include "checkpoint.h"
#include "percentile_tick_scheduler.h"
#include "traversal_cursor.h"

namespace hdrticks::iteration {

// Iterates through a histogram according to percentile levels. The levels start at 0% and approach
// 100% in the steps laid out by PercentileTickScheduler; the sequence always ends with exactly one
// checkpoint at 100% when the histogram holds any value, and is empty otherwise.
//
// Usage:
//   PercentileIterator it(histogram, 5);
//   while (it.hasNext()) {
//     auto checkpoint = it.next();
//     ...
//   }
//
// An iterator is a single-threaded cursor. The histogram must not be modified while it is iterated;
// if it is, hasNext() and next() throw ConcurrentModificationError. Independent iterators over the
// same histogram may run side by side.
class PercentileIterator {
 public:
  // Throws ConfigurationError for a null cursor or a non-positive number of ticks.
  PercentileIterator(std::unique_ptr<TraversalCursor> cursor, int32_t ticks_per_half_distance);

  // The histogram must outlive the iterator.
  PercentileIterator(const hdr_histogram* histogram, int32_t ticks_per_half_distance);

  PercentileIterator(PercentileIterator&&) = default;
  PercentileIterator& operator=(PercentileIterator&&) = default;
  PercentileIterator(const PercentileIterator&) = delete;
  PercentileIterator& operator=(const PercentileIterator&) = delete;

  // Whether next() will produce a checkpoint. Once the traversal has passed the last recorded value,
  // the first call confirms the closing 100% checkpoint. Repeated calls without next() are harmless.
  bool hasNext();

  // Produce the next checkpoint. Throws ExhaustedIteratorError, without changing any state, when
  // hasNext() is false.
  CheckpointRecord next();

  // Start a fresh iteration over the same histogram, possibly with a different number of ticks.
  // Throws ConfigurationError, without changing any state, if ticks_per_half_distance is not positive.
  void reset(int32_t ticks_per_half_distance);

  const PercentileTickScheduler& scheduler() const { return scheduler_; }

 private:
  void checkUnmodified() const;

  std::unique_ptr<TraversalCursor> cursor_;
  PercentileTickScheduler scheduler_;
  // The checkpoint at 100% has been returned.
  bool done_ = false;
  int64_t value_iterated_from_ = 0;
  int64_t count_to_previous_checkpoint_ = 0;
};

}  // namespace hdrticks::iteration
