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

#include <array>
#include <cstdint>
#include <type_traits>

namespace voile::util {

template <typename T>
using isEndianConvertible = std::conjunction<std::is_integral<T>, std::negation<std::is_same<T, bool>>>;

// Big endian (network order) encoding of unsigned integers. Independent of the host byte order.
template <typename T>
std::array<std::uint8_t, sizeof(T)> toBigEndianArrayBuffer(T v) {
  static_assert(isEndianConvertible<T>::value && std::is_unsigned_v<T>);
  std::array<std::uint8_t, sizeof(T)> ret;
  for (auto i = sizeof(T); i > 0; --i) {
    ret[i - 1] = static_cast<std::uint8_t>(v & 0xff);
    v = static_cast<T>(v >> 8);
  }
  return ret;
}

// Buffer must be at least sizeof(T) bytes long.
template <typename T>
T fromBigEndianBuffer(const std::uint8_t *buf) {
  static_assert(isEndianConvertible<T>::value && std::is_unsigned_v<T>);
  T v = 0;
  for (size_t i = 0; i < sizeof(T); ++i) {
    v = static_cast<T>((v << 8) | buf[i]);
  }
  return v;
}

}  // namespace voile::util
