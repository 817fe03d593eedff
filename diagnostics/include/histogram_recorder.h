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
#include <string>

#include <hdr/hdr_histogram.h>

#include "histogram_config.h"
#include "percentile_iterator.h"

namespace hdrticks::diagnostics {

// A named hdr_histogram with a unit, recorded to by a single thread. The recorder owns the
// histogram and closes it on destruction; it is neither copyable nor movable so that iterators
// created by percentiles() keep pointing at a live histogram. Create it in a smart pointer when it
// has to be shared.
class HistogramRecorder {
 public:
  // Throws ConfigurationError if the parameters are invalid (see validate()).
  HistogramRecorder(const std::string& name,
                    int64_t lowest_trackable_value,
                    int64_t highest_trackable_value,
                    int significant_figures,
                    Unit unit);
  explicit HistogramRecorder(const HistogramConfig& config);

  ~HistogramRecorder();
  HistogramRecorder(const HistogramRecorder&) = delete;
  HistogramRecorder& operator=(const HistogramRecorder&) = delete;

  // Values outside the trackable range and negative counts are dropped with a warning; the call then
  // returns false. A zero count records nothing and leaves min() and max() untouched.
  bool record(int64_t val);
  bool recordValues(int64_t val, int64_t count);

  // Drop every recorded value. Iterators created before the reset must be reset as well.
  void reset();

  int64_t totalCount() const { return histogram_->total_count; }
  // 0 for an empty histogram
  int64_t min() const;
  int64_t max() const;
  int64_t valueAtPercentile(double percentile) const;

  // Percentile checkpoints over the recorded values, with the configured number of ticks per half
  // distance or with an explicit one. The recorder must outlive the iterator and must not record
  // while it is used.
  iteration::PercentileIterator percentiles() const;
  iteration::PercentileIterator percentiles(int32_t ticks_per_half_distance) const;

  const std::string& name() const { return config_.name; }
  Unit unit() const { return config_.unit; }
  const HistogramConfig& config() const { return config_; }

 private:
  HistogramConfig config_;
  hdr_histogram* histogram_ = nullptr;
};

}  // namespace hdrticks::diagnostics
