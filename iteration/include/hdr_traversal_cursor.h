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

#include <hdr/hdr_histogram.h>

#include "traversal_cursor.h"

namespace hdrticks::iteration {

// Walks every bucket (counts index) of an hdr_histogram, including empty ones, by driving the
// library's basic iterator. The histogram must outlive the cursor.
class HdrTraversalCursor : public TraversalCursor {
 public:
  explicit HdrTraversalCursor(const hdr_histogram* histogram);

  void reset() override;
  bool hasNextBucket() const override { return iter_.cumulative_count < iter_.total_count; }
  bool advance() override;
  const TraversalState& state() const override { return state_; }
  bool modified() const override { return histogram_->total_count != iter_.total_count; }

 private:
  const hdr_histogram* histogram_;
  hdr_iter iter_;
  TraversalState state_;
};

}  // namespace hdrticks::iteration
