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

#include <cstdint>
#include <ostream>
#include <variant>

#include "types.hpp"

namespace voile {

// Basis points are capped at 100%.
inline constexpr uint16_t kMaxBasisPoints = 10000;

// Exit without waiting. A penalty factor is applied downstream.
struct Immediate {
  bool operator==(const Immediate&) const { return true; }
};

struct Standard {
  bool operator==(const Standard&) const { return true; }
};

struct Delayed {
  uint64_t blocks = 0;
  bool operator==(const Delayed& o) const { return blocks == o.blocks; }
};

struct Custom {
  uint16_t min_rate_bps = 0;
  uint16_t max_slippage_bps = 0;
  bool operator==(const Custom& o) const {
    return min_rate_bps == o.min_rate_bps && max_slippage_bps == o.max_slippage_bps;
  }
};

using ExitTerms = std::variant<Immediate, Standard, Delayed, Custom>;

// Wire tags of the canonical encoding. New variants get new values; existing ones never change.
enum class TermsTag : uint8_t { Immediate = 0x00, Standard = 0x01, Delayed = 0x02, Custom = 0x03 };

// Throws InvalidExitNote if either value exceeds kMaxBasisPoints.
Custom makeCustomTerms(uint16_t min_rate_bps, uint16_t max_slippage_bps);

// Throws InvalidExitNote for out-of-range Custom values.
void validateTerms(const ExitTerms& terms);

// Canonical big endian encoding:
//   Immediate 0x00 | Standard 0x01 | Delayed 0x02 || blocks(8) | Custom 0x03 || min_rate(2) || max_slippage(2)
Bytes encodeTerms(const ExitTerms& terms);

// Decodes one terms value from the front of buf and stores the number of bytes read in consumed.
// Throws InvalidExitNote on empty input, an unknown tag, a truncated payload or out-of-range values.
ExitTerms decodeTerms(const uint8_t* buf, size_t size, size_t& consumed);

// Decodes a buffer that holds exactly one terms value.
ExitTerms decodeTerms(const Bytes& buf);

std::ostream& operator<<(std::ostream& os, const ExitTerms& terms);

}  // namespace voile
