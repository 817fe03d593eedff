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

#include "percentile_iterator.h"

#include <utility>

#include "assertUtils.hpp"
#include "hdr_traversal_cursor.h"
#include "iteration_errors.h"

static logging::Logger ITER_LOGGER = logging::getLogger("hdrticks.iteration");

namespace hdrticks::iteration {

static std::unique_ptr<TraversalCursor> checkedCursor(std::unique_ptr<TraversalCursor> cursor) {
  if (!cursor) throw ConfigurationError("percentile iteration needs a traversal cursor");
  return cursor;
}

PercentileIterator::PercentileIterator(std::unique_ptr<TraversalCursor> cursor, int32_t ticks_per_half_distance)
    : cursor_(checkedCursor(std::move(cursor))), scheduler_(ticks_per_half_distance) {}

PercentileIterator::PercentileIterator(const hdr_histogram* histogram, int32_t ticks_per_half_distance)
    : PercentileIterator(std::make_unique<HdrTraversalCursor>(histogram), ticks_per_half_distance) {}

void PercentileIterator::checkUnmodified() const {
  if (cursor_->modified()) throw ConcurrentModificationError();
}

bool PercentileIterator::hasNext() {
  checkUnmodified();
  if (cursor_->hasNextBucket()) return true;
  if (done_) return false;
  if (scheduler_.terminalStepEmitted()) return true;
  // One additional step to exactly 100%, at the last recorded value.
  if (cursor_->state().total_count > 0) {
    scheduler_.enterTerminalStep();
    return true;
  }
  return false;
}

CheckpointRecord PercentileIterator::next() {
  if (!hasNext()) throw ExhaustedIteratorError();

  // The bucket the previous checkpoint was taken at may satisfy the next target as well.
  while (!scheduler_.shouldEmit(cursor_->state())) {
    // The last recorded value always satisfies the scheduler, so a pending checkpoint is never missed.
    bool advanced = cursor_->advance();
    HdrTicksAssert(advanced);
  }

  const auto& state = cursor_->state();
  CheckpointRecord record;
  record.percentile_level_iterated_to = scheduler_.targetPercentile();
  record.percentile_level_iterated_from = scheduler_.previousTargetPercentile();
  record.value_iterated_to = state.value_at_current;
  record.value_iterated_from = value_iterated_from_;
  record.count_at_value_iterated_to = state.count_at_current;
  record.count_added_in_this_iteration_step = state.cumulative_count - count_to_previous_checkpoint_;
  record.total_count_to_this_value = state.cumulative_count;
  record.total_value_to_this_value = state.total_value_to_current;
  record.total_count = state.total_count;
  record.percentile = (100.0 * static_cast<double>(state.cumulative_count)) / state.total_count;
  LOG_TRACE(ITER_LOGGER, "Checkpoint:" << record);

  value_iterated_from_ = record.value_iterated_to;
  count_to_previous_checkpoint_ = state.cumulative_count;
  if (scheduler_.targetPercentile() >= PercentileTickScheduler::kMaxPercentile) {
    // Either the confirmed closing step, or a level that saturated at 100% on its own. Both close the session.
    if (!scheduler_.terminalStepEmitted()) scheduler_.enterTerminalStep();
    done_ = true;
  } else {
    scheduler_.advanceTarget();
  }
  return record;
}

void PercentileIterator::reset(int32_t ticks_per_half_distance) {
  scheduler_.reset(ticks_per_half_distance);
  cursor_->reset();
  done_ = false;
  value_iterated_from_ = 0;
  count_to_previous_checkpoint_ = 0;
  LOG_DEBUG(ITER_LOGGER, "Percentile iteration reset:" << KVLOG(ticks_per_half_distance));
}

}  // namespace hdrticks::iteration
