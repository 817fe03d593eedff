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

#include <string>

#include "LoggingSpd.hpp"

// Global logger, used by the assertion macros.
extern logging::Logger GL;

namespace logging {

Logger getLogger(const std::string& name);

// Applies "log.<logger_name>:<LEVEL>" lines from the given file. Lines starting with '#' and lines
// for other components are ignored. Returns false when the file cannot be opened.
bool initLogger(const std::string& configFileName);

}  // namespace logging
