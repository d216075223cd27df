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
#include <string>
#include <vector>

namespace voile::util {

std::ostream &hexPrint(std::ostream &s, const uint8_t *data, size_t size, bool withPrefix = true);

struct HexPrintBuffer {
  const uint8_t *bytes;
  const size_t size;
};

// Print a buffer of bytes as its 0x<hex> representation.
inline std::ostream &operator<<(std::ostream &s, const HexPrintBuffer p) { return hexPrint(s, p.bytes, p.size); }

// Converts a buffer into a lowercase hex string.
std::string bufferToHex(const uint8_t *data, size_t size, bool withPrefix = false);

template <typename Container>
std::string toHex(const Container &c, bool withPrefix = false) {
  return bufferToHex(reinterpret_cast<const uint8_t *>(c.data()), c.size(), withPrefix);
}

// Converts a hex string into bytes. Handles a leading 0x (if present).
// Throws std::invalid_argument on odd length or non-hex characters.
std::vector<uint8_t> unhex(const std::string &hex);

}  // namespace voile::util
