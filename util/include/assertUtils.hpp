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

#include <cxxabi.h>
#include <cstdint>
#include <cstdlib>
#include <exception>
#include <execinfo.h>
#include <sstream>

#include "kvstream.h"
#include "Logger.hpp"

// Logs the demangled call stack of the caller to the global logger.
inline void printCallStack() {
  const uint32_t MAX_FRAMES = 64;
  void *addrlist[MAX_FRAMES];
  int addrLen = backtrace(addrlist, MAX_FRAMES);
  if (!addrLen) return;
  char **symbolsList = backtrace_symbols(addrlist, addrLen);
  if (!symbolsList) return;
  std::ostringstream os;
  // Skip the first frame, it is this function.
  for (int i = 1; i < addrLen; i++) {
    char *beginName = nullptr, *beginOffset = nullptr, *endOffset = nullptr;
    for (char *ptr = symbolsList[i]; *ptr; ++ptr) {
      if (*ptr == '(')
        beginName = ptr;
      else if (*ptr == '+')
        beginOffset = ptr;
      else if (*ptr == ')' && beginOffset) {
        endOffset = ptr;
        break;
      }
    }
    if (beginName && beginOffset && endOffset && beginName < beginOffset) {
      *beginName++ = '\0';
      *beginOffset++ = '\0';
      *endOffset = '\0';
      int status;
      char *demangled = abi::__cxa_demangle(beginName, nullptr, nullptr, &status);
      os << "  " << symbolsList[i] << " : " << (status == 0 ? demangled : beginName) << "+" << beginOffset << std::endl;
      std::free(demangled);
    } else {
      os << "  " << symbolsList[i] << std::endl;
    }
  }
  LOG_FATAL(GL, "\n" << os.str());
  std::free(symbolsList);
}

#define HDRTICKS_PRINT_DATA_AND_ASSERT(expr1, expr2, assertMacro)                                               \
  {                                                                                                             \
    LOG_FATAL(GL,                                                                                               \
              " " << (assertMacro) << KVLOG_FOR_ASSERT(expr1, expr2) << " in function " << __FUNCTION__ << " (" \
                  << __FILE__ << " " << __LINE__ << ")");                                                       \
    printCallStack();                                                                                           \
    std::terminate();                                                                                           \
  }

#define HdrTicksAssert(expr)                                                                                      \
  {                                                                                                               \
    if ((expr) != true) {                                                                                         \
      LOG_FATAL(GL,                                                                                               \
                " Assert: expression '" << #expr << "' is false in function " << __FUNCTION__ << " (" << __FILE__ \
                                        << " " << __LINE__ << ")");                                               \
      printCallStack();                                                                                           \
      std::terminate();                                                                                           \
    }                                                                                                             \
  }
// Assert (expr1 == expr2)
#define HdrTicksAssertEQ(expr1, expr2)                                                \
  {                                                                                   \
    if ((expr1) != (expr2)) HDRTICKS_PRINT_DATA_AND_ASSERT(expr1, expr2, "AssertEQ"); \
  }
// Assert (expr1 != expr2)
#define HdrTicksAssertNE(expr1, expr2)                                                \
  {                                                                                   \
    if ((expr1) == (expr2)) HDRTICKS_PRINT_DATA_AND_ASSERT(expr1, expr2, "AssertNE"); \
  }
// Assert (expr1 >= expr2)
#define HdrTicksAssertGE(expr1, expr2)                                               \
  {                                                                                  \
    if ((expr1) < (expr2)) HDRTICKS_PRINT_DATA_AND_ASSERT(expr1, expr2, "AssertGE"); \
  }
// Assert (expr1 > expr2)
#define HdrTicksAssertGT(expr1, expr2)                                                \
  {                                                                                   \
    if ((expr1) <= (expr2)) HDRTICKS_PRINT_DATA_AND_ASSERT(expr1, expr2, "AssertGT"); \
  }
// Assert (expr1 <= expr2)
#define HdrTicksAssertLE(expr1, expr2)                                               \
  {                                                                                  \
    if ((expr1) > (expr2)) HDRTICKS_PRINT_DATA_AND_ASSERT(expr1, expr2, "AssertLE"); \
  }
