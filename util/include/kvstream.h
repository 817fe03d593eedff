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

#include <sstream>
#include <string>
#include <type_traits>
#include <utility>

#include "type_traits.hpp"

// Turn up to 8 values into a parenthesized list of 16 arguments where every key is the stringized expression and is
// followed by its value. Use an alias variable when a specific key is wanted.
//
// Example usage:
// LOG_INFO(logger, "Checkpoint emitted:" << KVLOG(percentile, value));
#define HDRTICKS_GET_KVARGS(_1, _2, _3, _4, _5, _6, _7, _8, NAME, ...) NAME
#define KVARGS(...)                                                                                              \
  HDRTICKS_GET_KVARGS(__VA_ARGS__, KVARGS8, KVARGS7, KVARGS6, KVARGS5, KVARGS4, KVARGS3, KVARGS2, KVARGS1, UNUSED) \
  (__VA_ARGS__)
#define KVARGS8(_1, _2, _3, _4, _5, _6, _7, _8) (#_1, _1, #_2, _2, #_3, _3, #_4, _4, #_5, _5, #_6, _6, #_7, _7, #_8, _8)
#define KVARGS7(_1, _2, _3, _4, _5, _6, _7) (#_1, _1, #_2, _2, #_3, _3, #_4, _4, #_5, _5, #_6, _6, #_7, _7)
#define KVARGS6(_1, _2, _3, _4, _5, _6) (#_1, _1, #_2, _2, #_3, _3, #_4, _4, #_5, _5, #_6, _6)
#define KVARGS5(_1, _2, _3, _4, _5) (#_1, _1, #_2, _2, #_3, _3, #_4, _4, #_5, _5)
#define KVARGS4(_1, _2, _3, _4) (#_1, _1, #_2, _2, #_3, _3, #_4, _4)
#define KVARGS3(_1, _2, _3) (#_1, _1, #_2, _2, #_3, _3)
#define KVARGS2(_1, _2) (#_1, _1, #_2, _2)
#define KVARGS1(_1) (#_1, _1)

#define UNUSED(expr) (void)(expr)

#define KVLOG(...) KvLog<true> KVARGS(__VA_ARGS__)

// Asserts may name values that have no stream operator; those print as '_'.
#define KVLOG_FOR_ASSERT(...) KvLog<false> KVARGS(__VA_ARGS__)

// Recursive variadic formatting of "key: value" pairs. With Strict=true a value without
// `std::ostream::operator<<` is a compile error.
template <bool Strict, typename K, typename V>
void KvLogPair(std::stringstream &ss, K &&key, V &&val) {
  ss << std::forward<K>(key) << ": ";
  if constexpr (hdrticks::is_streamable<std::ostream, V>::value) {
    if constexpr (std::is_same_v<std::decay_t<V>, bool>) {
      ss << (val ? "True" : "False");
    } else {
      ss << std::forward<V>(val);
    }
  } else {
    static_assert(!Strict, "Cannot log types that do not implement ostream::operator<<");
    ss << "_";
  }
}

template <bool Strict, typename K, typename V>
void KvLog(std::stringstream &ss, K &&key, V &&val) {
  KvLogPair<Strict>(ss, std::forward<K>(key), std::forward<V>(val));
}

template <bool Strict, typename K, typename V, typename... KVPAIRS>
void KvLog(std::stringstream &ss, K &&key, V &&val, KVPAIRS &&... kvpairs) {
  KvLogPair<Strict>(ss, std::forward<K>(key), std::forward<V>(val));
  ss << ", ";
  KvLog<Strict>(ss, std::forward<KVPAIRS>(kvpairs)...);
}

template <bool Strict, typename... KVPAIRS>
std::string KvLog(KVPAIRS &&... kvpairs) {
  std::stringstream ss;
  ss << " ";
  KvLog<Strict>(ss, std::forward<KVPAIRS>(kvpairs)...);
  return ss.str();
}
