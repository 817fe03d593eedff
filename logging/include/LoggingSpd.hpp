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

#include <memory>
#include <sstream>
#include <string>

#include "spdlog/spdlog.h"

namespace logging {

using Logger = std::shared_ptr<spdlog::logger>;

}  // namespace logging

#define LOG_COMMON(l, level, s)      \
  {                                  \
    if ((l)->should_log(level)) {    \
      std::ostringstream log_ss_;    \
      log_ss_ << s;                  \
      (l)->log(level, log_ss_.str()); \
    }                                \
  }

#define LOG_TRACE(l, s) LOG_COMMON(l, spdlog::level::trace, s)
#define LOG_DEBUG(l, s) LOG_COMMON(l, spdlog::level::debug, s)
#define LOG_INFO(l, s) LOG_COMMON(l, spdlog::level::info, s)
#define LOG_WARN(l, s) LOG_COMMON(l, spdlog::level::warn, s)
#define LOG_ERROR(l, s) LOG_COMMON(l, spdlog::level::err, s)
#define LOG_FATAL(l, s) LOG_COMMON(l, spdlog::level::critical, s)
