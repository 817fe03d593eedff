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

#include "percentile_tick_scheduler.h"

#include <algorithm>
#include <cmath>
#include <limits>
#include <string>

#include "assertUtils.hpp"
#include "iteration_errors.h"

static logging::Logger ITER_LOGGER = logging::getLogger("hdrticks.iteration");

namespace hdrticks::iteration {

static void validateTicks(int32_t ticks_per_half_distance) {
  if (ticks_per_half_distance <= 0) {
    throw ConfigurationError("percentile ticks per half distance must be positive, got " +
                             std::to_string(ticks_per_half_distance));
  }
}

PercentileTickScheduler::PercentileTickScheduler(int32_t ticks_per_half_distance)
    : ticks_per_half_distance_(ticks_per_half_distance) {
  validateTicks(ticks_per_half_distance);
}

void PercentileTickScheduler::reset(int32_t ticks_per_half_distance) {
  validateTicks(ticks_per_half_distance);
  ticks_per_half_distance_ = ticks_per_half_distance;
  target_percentile_ = 0.0;
  previous_target_percentile_ = 0.0;
  terminal_step_emitted_ = false;
}

bool PercentileTickScheduler::shouldEmit(const TraversalState& state) const {
  if (state.count_at_current == 0) return false;
  // The last recorded value is at 100% whatever the floating point division says.
  if (state.cumulative_count == state.total_count) return true;
  if (target_percentile_ >= kMaxPercentile) return false;
  double current_percentile = (100.0 * static_cast<double>(state.cumulative_count)) / state.total_count;
  return current_percentile >= target_percentile_;
}

int64_t PercentileTickScheduler::reportingTicks(int32_t ticks_per_half_distance, double percentile_level) {
  if (!(percentile_level < kMaxPercentile)) return 0;
  // The evaluation order is fixed so that levels match other HdrHistogram implementations bit for bit.
  auto half_distances = static_cast<int64_t>(std::log(100.0 / (100.0 - percentile_level)) / std::log(2.0));
  auto exponent = half_distances + 1;
  if (exponent > 62 || ticks_per_half_distance > (std::numeric_limits<int64_t>::max() >> exponent)) return 0;
  return ticks_per_half_distance * (int64_t{1} << exponent);
}

void PercentileTickScheduler::advanceTarget() {
  HdrTicksAssertGT(kMaxPercentile, target_percentile_);
  previous_target_percentile_ = target_percentile_;

  auto ticks = reportingTicks(ticks_per_half_distance_, target_percentile_);
  double next_target = ticks > 0 ? target_percentile_ + 100.0 / ticks : kMaxPercentile;
  if (next_target <= target_percentile_ || next_target >= kMaxPercentile) {
    // Either the tick no longer moves the level or it lands on 100%; the last recorded value closes the session.
    LOG_WARN(ITER_LOGGER,
             "Percentile level saturated at 100%:" << KVLOG(ticks_per_half_distance_, target_percentile_, ticks));
    next_target = kMaxPercentile;
  }
  target_percentile_ = std::min(next_target, kMaxPercentile);
  HdrTicksAssertLE(previous_target_percentile_, target_percentile_);
}

void PercentileTickScheduler::enterTerminalStep() {
  target_percentile_ = kMaxPercentile;
  terminal_step_emitted_ = true;
}

}  // namespace hdrticks::iteration
