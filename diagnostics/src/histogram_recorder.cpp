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

#include "histogram_recorder.h"

#include "assertUtils.hpp"

static logging::Logger RECORDER_LOGGER = logging::getLogger("hdrticks.recorder");

namespace hdrticks::diagnostics {

static HistogramConfig makeConfig(const std::string& name,
                                  int64_t lowest_trackable_value,
                                  int64_t highest_trackable_value,
                                  int significant_figures,
                                  Unit unit) {
  HistogramConfig config;
  setDefaultConfiguration(config);
  config.name = name;
  config.lowest_trackable_value = lowest_trackable_value;
  config.highest_trackable_value = highest_trackable_value;
  config.significant_figures = significant_figures;
  config.unit = unit;
  return config;
}

HistogramRecorder::HistogramRecorder(const std::string& name,
                                     int64_t lowest_trackable_value,
                                     int64_t highest_trackable_value,
                                     int significant_figures,
                                     Unit unit)
    : HistogramRecorder(makeConfig(name, lowest_trackable_value, highest_trackable_value, significant_figures, unit)) {}

HistogramRecorder::HistogramRecorder(const HistogramConfig& config) : config_(config) {
  validate(config_);
  auto rv = hdr_init(
      config_.lowest_trackable_value, config_.highest_trackable_value, config_.significant_figures, &histogram_);
  // Validated parameters leave only allocation failures
  HdrTicksAssertEQ(0, rv);
}

HistogramRecorder::~HistogramRecorder() {
  hdr_close(histogram_);
  histogram_ = nullptr;
}

bool HistogramRecorder::record(int64_t val) {
  if (!hdr_record_value(histogram_, val)) {
    LOG_WARN(RECORDER_LOGGER, "Failed to record value: " << KVLOG(config_.name, val, config_.unit));
    return false;
  }
  return true;
}

bool HistogramRecorder::recordValues(int64_t val, int64_t count) {
  // hdr_record_values() would still move min/max for a zero count
  if (count == 0) return true;
  if (count < 0 || !hdr_record_values(histogram_, val, count)) {
    LOG_WARN(RECORDER_LOGGER, "Failed to record values: " << KVLOG(config_.name, val, count, config_.unit));
    return false;
  }
  return true;
}

void HistogramRecorder::reset() { hdr_reset(histogram_); }

int64_t HistogramRecorder::min() const {
  if (histogram_->total_count == 0) return 0;
  return hdr_min(histogram_);
}

int64_t HistogramRecorder::max() const { return hdr_max(histogram_); }

int64_t HistogramRecorder::valueAtPercentile(double percentile) const {
  return hdr_value_at_percentile(histogram_, percentile);
}

iteration::PercentileIterator HistogramRecorder::percentiles() const {
  return percentiles(config_.percentile_ticks_per_half_distance);
}

iteration::PercentileIterator HistogramRecorder::percentiles(int32_t ticks_per_half_distance) const {
  return iteration::PercentileIterator(histogram_, ticks_per_half_distance);
}

}  // namespace hdrticks::diagnostics
