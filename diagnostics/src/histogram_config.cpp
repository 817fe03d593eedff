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

#include "histogram_config.h"

#include <sstream>

#include "Logger.hpp"
#include "iteration_errors.h"

using hdrticks::iteration::ConfigurationError;

static auto logger = logging::getLogger("hdrticks.config");

namespace hdrticks::diagnostics {

// Copy a value from the YAML node to `out`.
// Throws an exception if no value could be read but the value is required.
template <typename T>
static void readYamlField(const YAML::Node& yaml, const std::string& index, T& out, bool value_required = true) {
  if (!yaml[index]) {
    if (value_required) throw ConfigurationError("missing required key \"" + index + "\"");
    LOG_INFO(logger, "No value found for \"" << index << "\", using " << out);
    return;
  }
  try {
    out = yaml[index].as<T>();
  } catch (const YAML::Exception& e) {
    // The YAML exception text only repeats the position, the key is more useful
    std::ostringstream msg;
    msg << "Failed to read \"" << index << "\"";
    throw ConfigurationError(msg.str());
  }
}

void setDefaultConfiguration(HistogramConfig& config) { config = HistogramConfig{}; }

void parseConfig(HistogramConfig& config, const YAML::Node& yaml) {
  if (!yaml.IsMap()) throw ConfigurationError("histogram configuration must be a YAML map");
  readYamlField(yaml, "name", config.name);
  readYamlField(yaml, "lowest_trackable_value", config.lowest_trackable_value, false);
  readYamlField(yaml, "highest_trackable_value", config.highest_trackable_value, false);
  readYamlField(yaml, "significant_figures", config.significant_figures, false);
  readYamlField(yaml, "percentile_ticks_per_half_distance", config.percentile_ticks_per_half_distance, false);

  std::ostringstream default_unit;
  default_unit << config.unit;
  std::string unit = default_unit.str();
  readYamlField(yaml, "unit", unit, false);
  config.unit = parseUnit(unit);
}

HistogramConfig loadConfigFile(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const YAML::Exception& e) {
    throw ConfigurationError("cannot load " + path + ": " + e.what());
  }
  HistogramConfig config;
  setDefaultConfiguration(config);
  parseConfig(config, yaml);
  validate(config);
  return config;
}

void validate(const HistogramConfig& config) {
  if (config.name.empty()) throw ConfigurationError("histogram name must not be empty");
  if (config.lowest_trackable_value < 1) {
    throw ConfigurationError(config.name + ": lowest_trackable_value must be at least 1");
  }
  if (config.highest_trackable_value < 2 * config.lowest_trackable_value) {
    throw ConfigurationError(config.name + ": highest_trackable_value must be at least twice lowest_trackable_value");
  }
  if (config.significant_figures < 1 || config.significant_figures > 5) {
    throw ConfigurationError(config.name + ": significant_figures must be between 1 and 5");
  }
  if (config.percentile_ticks_per_half_distance <= 0) {
    throw ConfigurationError(config.name + ": percentile_ticks_per_half_distance must be positive");
  }
}

Unit parseUnit(const std::string& unit) {
  if (unit == "nanoseconds") return Unit::NANOSECONDS;
  if (unit == "microseconds") return Unit::MICROSECONDS;
  if (unit == "milliseconds") return Unit::MILLISECONDS;
  if (unit == "seconds") return Unit::SECONDS;
  if (unit == "minutes") return Unit::MINUTES;
  if (unit == "bytes") return Unit::BYTES;
  if (unit == "kb") return Unit::KB;
  if (unit == "mb") return Unit::MB;
  if (unit == "gb") return Unit::GB;
  if (unit == "count") return Unit::COUNT;
  throw ConfigurationError("unknown unit \"" + unit + "\"");
}

std::ostream& operator<<(std::ostream& os, const Unit& unit) {
  switch (unit) {
    case Unit::NANOSECONDS:
      os << "nanoseconds";
      break;
    case Unit::MICROSECONDS:
      os << "microseconds";
      break;
    case Unit::MILLISECONDS:
      os << "milliseconds";
      break;
    case Unit::SECONDS:
      os << "seconds";
      break;
    case Unit::MINUTES:
      os << "minutes";
      break;
    case Unit::BYTES:
      os << "bytes";
      break;
    case Unit::KB:
      os << "kb";
      break;
    case Unit::MB:
      os << "mb";
      break;
    case Unit::GB:
      os << "gb";
      break;
    case Unit::COUNT:
      os << "count";
      break;
  }
  return os;
}

}  // namespace hdrticks::diagnostics
