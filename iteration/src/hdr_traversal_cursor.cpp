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

#include "hdr_traversal_cursor.h"

#include "iteration_errors.h"

namespace hdrticks::iteration {

HdrTraversalCursor::HdrTraversalCursor(const hdr_histogram* histogram) : histogram_(histogram) {
  if (histogram_ == nullptr) throw ConfigurationError("cannot traverse a null histogram");
  reset();
}

void HdrTraversalCursor::reset() {
  hdr_iter_init(&iter_, histogram_);
  state_ = TraversalState{};
  state_.total_count = iter_.total_count;
}

bool HdrTraversalCursor::advance() {
  // hdr_iter_next() moves exactly one counts index while values remain ahead of the cursor.
  if (!hasNextBucket() || !hdr_iter_next(&iter_)) return false;
  state_.count_at_current = iter_.count;
  state_.cumulative_count = iter_.cumulative_count;
  state_.value_at_current = iter_.highest_equivalent_value;
  // Unsigned so that a sum beyond 64 bits wraps instead of overflowing
  state_.total_value_to_current = static_cast<int64_t>(static_cast<uint64_t>(state_.total_value_to_current) +
                                                       static_cast<uint64_t>(iter_.count) *
                                                           static_cast<uint64_t>(iter_.highest_equivalent_value));
  return true;
}

}  // namespace hdrticks::iteration
