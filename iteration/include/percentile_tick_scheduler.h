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

#include "traversal_cursor.h"

namespace hdrticks::iteration {

// Decides when the traversal has reached the next percentile checkpoint and where the checkpoint
// after it lies.
//
// Checkpoints are laid out in "half distances" to 100%: [0, 50), [50, 75), [75, 87.5), ... and each
// half distance is split into `ticks_per_half_distance` equal ticks. The tick size therefore stays
// fixed inside a half distance and halves whenever one is crossed, which keeps the number of steps
// per scale constant and the levels easy to read (0, 10, 20, ..., 50, 55, ..., 75, 77.5, ... for 5
// ticks).
class PercentileTickScheduler {
 public:
  static constexpr double kMaxPercentile = 100.0;

  // Throws ConfigurationError if ticks_per_half_distance is not positive.
  explicit PercentileTickScheduler(int32_t ticks_per_half_distance);

  // Reinitialize all levels to 0% and clear the terminal flag. On ConfigurationError nothing changes.
  void reset(int32_t ticks_per_half_distance);

  // Whether the bucket the traversal is positioned at satisfies the current target. Empty buckets never do.
  bool shouldEmit(const TraversalState& state) const;

  // Move to the next target. Must only be called while the target is below 100%.
  void advanceTarget();

  // Target exactly 100% for the final checkpoint of the session.
  void enterTerminalStep();

  double targetPercentile() const { return target_percentile_; }
  double previousTargetPercentile() const { return previous_target_percentile_; }
  bool terminalStepEmitted() const { return terminal_step_emitted_; }
  int32_t ticksPerHalfDistance() const { return ticks_per_half_distance_; }

  // The number of equal ticks the whole 0-100 range is divided into at the scale of percentile_level:
  // ticks_per_half_distance * 2^(trunc(ln(100 / (100 - level)) / ln(2)) + 1).
  // Returns 0 if the count does not fit in 64 bits or the level is not below 100%.
  static int64_t reportingTicks(int32_t ticks_per_half_distance, double percentile_level);

 private:
  int32_t ticks_per_half_distance_;
  double target_percentile_ = 0.0;
  double previous_target_percentile_ = 0.0;
  bool terminal_step_emitted_ = false;
};

}  // namespace hdrticks::iteration
