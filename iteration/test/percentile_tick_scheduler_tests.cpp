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

#include <limits>
#include <vector>

#include "gtest/gtest.h"
#include "iteration_errors.h"
#include "percentile_tick_scheduler.h"

using namespace hdrticks::iteration;

namespace {

TraversalState at(int64_t count_at_current, int64_t cumulative_count, int64_t total_count) {
  TraversalState state;
  state.count_at_current = count_at_current;
  state.cumulative_count = cumulative_count;
  state.total_count = total_count;
  return state;
}

std::vector<double> advance(PercentileTickScheduler& scheduler, size_t steps) {
  std::vector<double> targets;
  for (size_t i = 0; i < steps; ++i) {
    scheduler.advanceTarget();
    targets.push_back(scheduler.targetPercentile());
  }
  return targets;
}

TEST(percentile_tick_scheduler_tests, rejects_non_positive_ticks) {
  ASSERT_THROW(PercentileTickScheduler(0), ConfigurationError);
  ASSERT_THROW(PercentileTickScheduler(-3), ConfigurationError);
  ASSERT_THROW(PercentileTickScheduler(std::numeric_limits<int32_t>::min()), ConfigurationError);
  ASSERT_NO_THROW(PercentileTickScheduler(1));
}

TEST(percentile_tick_scheduler_tests, starts_at_zero) {
  PercentileTickScheduler scheduler(4);
  ASSERT_EQ(4, scheduler.ticksPerHalfDistance());
  ASSERT_EQ(0.0, scheduler.targetPercentile());
  ASSERT_EQ(0.0, scheduler.previousTargetPercentile());
  ASSERT_FALSE(scheduler.terminalStepEmitted());
}

TEST(percentile_tick_scheduler_tests, reporting_ticks) {
  ASSERT_EQ(2, PercentileTickScheduler::reportingTicks(1, 0.0));
  ASSERT_EQ(4, PercentileTickScheduler::reportingTicks(1, 50.0));
  ASSERT_EQ(8, PercentileTickScheduler::reportingTicks(1, 75.0));
  ASSERT_EQ(16, PercentileTickScheduler::reportingTicks(1, 87.5));
  ASSERT_EQ(10, PercentileTickScheduler::reportingTicks(5, 0.0));
  ASSERT_EQ(10, PercentileTickScheduler::reportingTicks(5, 40.0));
  ASSERT_EQ(20, PercentileTickScheduler::reportingTicks(5, 50.0));
  // log2(100 / 10) = 3.32 is truncated to 3
  ASSERT_EQ(80, PercentileTickScheduler::reportingTicks(5, 90.0));
  // log2(100) = 6.64 is truncated to 6
  ASSERT_EQ(640, PercentileTickScheduler::reportingTicks(5, 99.0));
}

TEST(percentile_tick_scheduler_tests, reporting_ticks_out_of_range) {
  ASSERT_EQ(0, PercentileTickScheduler::reportingTicks(1, 100.0));
  ASSERT_EQ(0, PercentileTickScheduler::reportingTicks(1, 150.0));
  // 2^31 * 2^40 does not fit in 64 bits
  ASSERT_EQ(0, PercentileTickScheduler::reportingTicks(std::numeric_limits<int32_t>::max(), 99.9999999999));
}

TEST(percentile_tick_scheduler_tests, one_tick_halves_the_distance) {
  PercentileTickScheduler scheduler(1);
  auto targets = advance(scheduler, 8);
  std::vector<double> expected{50.0, 75.0, 87.5, 93.75, 96.875, 98.4375, 99.21875, 99.609375};
  ASSERT_EQ(expected, targets);
  ASSERT_EQ(99.21875, scheduler.previousTargetPercentile());
}

TEST(percentile_tick_scheduler_tests, five_ticks_per_half_distance) {
  PercentileTickScheduler scheduler(5);
  auto targets = advance(scheduler, 20);
  std::vector<double> expected{10.0, 20.0, 30.0, 40.0, 50.0, 55.0, 60.0, 65.0,  70.0,  75.0,
                               77.5, 80.0, 82.5, 85.0, 87.5, 88.75, 90.0, 91.25, 92.5, 93.75};
  ASSERT_EQ(expected.size(), targets.size());
  for (size_t i = 0; i < expected.size(); ++i) {
    ASSERT_DOUBLE_EQ(expected[i], targets[i]) << "step " << i;
  }
}

TEST(percentile_tick_scheduler_tests, previous_target_trails_target) {
  PercentileTickScheduler scheduler(3);
  double last = scheduler.targetPercentile();
  for (int i = 0; i < 100; ++i) {
    scheduler.advanceTarget();
    ASSERT_EQ(last, scheduler.previousTargetPercentile());
    ASSERT_LT(last, scheduler.targetPercentile());
    ASSERT_LT(scheduler.targetPercentile(), PercentileTickScheduler::kMaxPercentile);
    last = scheduler.targetPercentile();
  }
}

TEST(percentile_tick_scheduler_tests, should_emit) {
  PercentileTickScheduler scheduler(1);
  scheduler.advanceTarget();
  ASSERT_EQ(50.0, scheduler.targetPercentile());

  ASSERT_FALSE(scheduler.shouldEmit(at(1, 49, 100)));
  ASSERT_TRUE(scheduler.shouldEmit(at(1, 50, 100)));
  ASSERT_TRUE(scheduler.shouldEmit(at(3, 80, 100)));
  // Never on an empty bucket, even past the target
  ASSERT_FALSE(scheduler.shouldEmit(at(0, 80, 100)));
  ASSERT_FALSE(scheduler.shouldEmit(at(0, 100, 100)));
}

TEST(percentile_tick_scheduler_tests, terminal_step) {
  PercentileTickScheduler scheduler(1);
  scheduler.advanceTarget();
  scheduler.advanceTarget();
  scheduler.enterTerminalStep();
  ASSERT_TRUE(scheduler.terminalStepEmitted());
  ASSERT_EQ(100.0, scheduler.targetPercentile());
  ASSERT_EQ(50.0, scheduler.previousTargetPercentile());
  // 100% is only reached with the last recorded value
  ASSERT_FALSE(scheduler.shouldEmit(at(5, 99, 100)));
  ASSERT_TRUE(scheduler.shouldEmit(at(1, 100, 100)));
}

TEST(percentile_tick_scheduler_tests, last_recorded_value_reaches_any_target) {
  PercentileTickScheduler scheduler(1);
  for (int i = 0; i < 40; ++i) scheduler.advanceTarget();
  const int64_t huge = int64_t{1} << 60;
  ASSERT_TRUE(scheduler.shouldEmit(at(1, huge + 1, huge + 1)));
}

TEST(percentile_tick_scheduler_tests, reset) {
  PercentileTickScheduler scheduler(2);
  advance(scheduler, 5);
  scheduler.enterTerminalStep();

  scheduler.reset(7);
  ASSERT_EQ(7, scheduler.ticksPerHalfDistance());
  ASSERT_EQ(0.0, scheduler.targetPercentile());
  ASSERT_EQ(0.0, scheduler.previousTargetPercentile());
  ASSERT_FALSE(scheduler.terminalStepEmitted());

  scheduler.advanceTarget();
  ASSERT_DOUBLE_EQ(100.0 / 14, scheduler.targetPercentile());
}

TEST(percentile_tick_scheduler_tests, failed_reset_keeps_state) {
  PercentileTickScheduler scheduler(1);
  advance(scheduler, 2);
  ASSERT_THROW(scheduler.reset(0), ConfigurationError);
  ASSERT_EQ(1, scheduler.ticksPerHalfDistance());
  ASSERT_EQ(75.0, scheduler.targetPercentile());
  ASSERT_EQ(50.0, scheduler.previousTargetPercentile());
}

// Near 100% the tick eventually stops moving the level in double precision. The level then
// saturates at exactly 100% instead of stalling below it.
void expectSaturation(int32_t ticks, size_t max_steps) {
  PercentileTickScheduler scheduler(ticks);
  size_t steps = 0;
  while (scheduler.targetPercentile() < PercentileTickScheduler::kMaxPercentile) {
    double before = scheduler.targetPercentile();
    scheduler.advanceTarget();
    ASSERT_GT(scheduler.targetPercentile(), before);
    ASSERT_LE(scheduler.targetPercentile(), PercentileTickScheduler::kMaxPercentile);
    ASSERT_LT(++steps, max_steps);
  }
  ASSERT_EQ(PercentileTickScheduler::kMaxPercentile, scheduler.targetPercentile());
  ASSERT_FALSE(scheduler.terminalStepEmitted());
}

TEST(percentile_tick_scheduler_tests, saturates_at_one_hundred) {
  expectSaturation(1, 1000);
  expectSaturation(1000, 1000 * 1000);
}

}  // namespace
