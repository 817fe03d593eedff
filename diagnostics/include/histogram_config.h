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
#include <string>

#include <yaml-cpp/yaml.h>

namespace hdrticks::diagnostics {

enum class Unit {
  NANOSECONDS,
  MICROSECONDS,
  MILLISECONDS,
  SECONDS,
  MINUTES,

  BYTES,
  KB,
  MB,
  GB,

  // Things like queue length, size of a map, etc..
  COUNT
};

// Everything needed to create a HistogramRecorder and report its percentile distribution.
// The trackable range and precision come directly from hdr_init().
struct HistogramConfig {
  std::string name;
  int64_t lowest_trackable_value = 1;
  // One hour in microseconds
  int64_t highest_trackable_value = 3600000000;
  int significant_figures = 3;
  Unit unit = Unit::COUNT;
  int32_t percentile_ticks_per_half_distance = 5;
};

// Fill the given HistogramConfig with default values
void setDefaultConfiguration(HistogramConfig&);

// Read the configuration from a YAML map. `name` is required, every other key keeps its current
// value when absent. Throws ConfigurationError for a missing name or an unreadable value.
void parseConfig(HistogramConfig&, const YAML::Node&);

// Defaults, then the given YAML file, then validation.
HistogramConfig loadConfigFile(const std::string& path);

// Throws ConfigurationError if the parameters cannot describe a histogram.
void validate(const HistogramConfig&);

// Lower case unit names, as written by operator<<. Throws ConfigurationError for anything else.
Unit parseUnit(const std::string&);

std::ostream& operator<<(std::ostream& os, const Unit&);

}  // namespace hdrticks::diagnostics
