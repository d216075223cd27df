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
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

#include "endianness.hpp"
#include "hex_tools.h"
#include "sha_hash.hpp"

namespace voile {

using Bytes = std::vector<uint8_t>;
using Bytes32 = std::array<uint8_t, 32>;
using Nullifier = Bytes32;
using OwnerBinding = Bytes32;

// 0x-prefixed lowercase hex, the external representation of every 32-byte value.
inline std::string toHex(const Bytes32& b) { return util::toHex(b, true); }

// Parses exactly 32 bytes from hex with an optional 0x prefix. Throws std::invalid_argument otherwise.
Bytes32 bytes32FromHex(const std::string& hex);

// SHA3-256 over a domain label followed by the added parts:
//   Bytes32 d = LabeledHash{"voile.nullifier"}.add(id).add(secret).finish();
class LabeledHash {
 public:
  explicit LabeledHash(std::string_view label) {
    hash_.init();
    hash_.update(label.data(), label.size());
  }

  LabeledHash& add(const uint8_t* data, size_t size) {
    hash_.update(data, size);
    return *this;
  }

  template <typename Span>
  LabeledHash& add(const Span& span) {
    hash_.update(span.data(), span.size());
    return *this;
  }

  LabeledHash& addU64(uint64_t v) { return add(util::toBigEndianArrayBuffer(v)); }

  Bytes32 finish() { return hash_.finish(); }

 private:
  util::SHA3_256 hash_;
};

}  // namespace voile
