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

#include <stdexcept>
#include <string>

namespace hdrticks::iteration {

// Thrown when an iterator, a recorder or a configuration is given parameters it cannot work with, e.g. a
// non-positive number of percentile ticks per half distance.
class ConfigurationError : public std::invalid_argument {
 public:
  explicit ConfigurationError(const std::string& what) : std::invalid_argument("configuration error: " + what) {}
};

// Thrown when next() is called on an iterator that has no further checkpoints.
class ExhaustedIteratorError : public std::out_of_range {
 public:
  ExhaustedIteratorError() : std::out_of_range("No further checkpoints: the percentile iteration is exhausted.") {}
};

// Thrown when the histogram under iteration received new values after the iteration started.
class ConcurrentModificationError : public std::runtime_error {
 public:
  ConcurrentModificationError() : std::runtime_error("The histogram was modified during percentile iteration.") {}
};

}  // namespace hdrticks::iteration
