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
#include <ostream>

namespace hdrticks::iteration {

// A snapshot of the histogram at one emitted percentile checkpoint.
struct CheckpointRecord {
  // The percentile level this checkpoint was scheduled for, and the one of the checkpoint before it.
  double percentile_level_iterated_to = 0.0;
  double percentile_level_iterated_from = 0.0;

  // The highest value equivalent to the bucket the checkpoint was reached at, and the same for the
  // previous checkpoint (0 for the first one).
  int64_t value_iterated_to = 0;
  int64_t value_iterated_from = 0;

  int64_t count_at_value_iterated_to = 0;
  int64_t count_added_in_this_iteration_step = 0;
  int64_t total_count_to_this_value = 0;
  int64_t total_value_to_this_value = 0;
  int64_t total_count = 0;

  // The actual cumulative percentile at value_iterated_to.
  double percentile = 0.0;

  bool operator==(const CheckpointRecord& other) const {
    return percentile_level_iterated_to == other.percentile_level_iterated_to &&
           percentile_level_iterated_from == other.percentile_level_iterated_from &&
           value_iterated_to == other.value_iterated_to && value_iterated_from == other.value_iterated_from &&
           count_at_value_iterated_to == other.count_at_value_iterated_to &&
           count_added_in_this_iteration_step == other.count_added_in_this_iteration_step &&
           total_count_to_this_value == other.total_count_to_this_value &&
           total_value_to_this_value == other.total_value_to_this_value && total_count == other.total_count &&
           percentile == other.percentile;
  }
  bool operator!=(const CheckpointRecord& other) const { return !(*this == other); }
};

std::ostream& operator<<(std::ostream& os, const CheckpointRecord&);

}  // namespace hdrticks::iteration
