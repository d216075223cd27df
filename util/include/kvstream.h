// Voile
//
// Copyright (c) 2023 VMware, Inc. All Rights Reserved.
//
// This product is licensed to you under the Apache 2.0 license (the "License").
// You may not use this product except in compliance with the Apache 2.0
// License.
//
// This product may include a number of subcomponents with separate copyright
// notices and license terms. Your use of these subcomponents is subject to the
// terms and conditions of the subcomponent's license, as noted in the
// LICENSE file.

#pragma once

#include <sstream>
#include <string>
#include <type_traits>
#include <utility>

#include "macros.h"
#include "type_traits.h"

#define KVLOG(...) KvLog<true> KVARGS(__VA_ARGS__)

// Values that cannot be streamed are printed as '_' so that asserts work on any type.
#define KVLOG_FOR_ASSERT(...) KvLog<false> KVARGS(__VA_ARGS__)

// Formats key-value pairs that get appended to log lines, e.g. " amount: 10, owner: 0x00..".
// With Strict=true, a value type without `std::ostream::operator<<` is a compile error.

template <bool Strict, typename K, typename V>
void KvLogPair(std::stringstream &ss, K &&key, V &&val) {
  ss << std::forward<K>(key) << ": ";
  if constexpr (voile::is_streamable<std::ostream, V>::value) {
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

template <bool Strict, typename K, typename V, typename... KVPAIRS>
void KvLogImpl(std::stringstream &ss, K &&key, V &&val, KVPAIRS &&...kvpairs) {
  KvLogPair<Strict>(ss, std::forward<K>(key), std::forward<V>(val));
  if constexpr (sizeof...(KVPAIRS) > 0) {
    ss << ", ";
    KvLogImpl<Strict>(ss, std::forward<KVPAIRS>(kvpairs)...);
  }
}

template <bool Strict, typename... KVPAIRS>
std::string KvLog(KVPAIRS &&...kvpairs) {
  std::stringstream ss;
  ss << " ";
  KvLogImpl<Strict>(ss, std::forward<KVPAIRS>(kvpairs)...);
  return ss.str();
}
