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

#include "hex_tools.h"

#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace voile::util {

std::ostream &hexPrint(std::ostream &s, const uint8_t *data, size_t size, bool withPrefix) {
  std::ios::fmtflags f(s.flags());
  if (withPrefix) {
    s << "0x";
  }
  for (size_t i = 0; i < size; i++) {
    s << std::hex << std::setw(2) << std::setfill('0') << static_cast<std::uint16_t>(data[i]);
  }
  s.flags(f);
  return s;
}

std::string bufferToHex(const uint8_t *data, size_t size, bool withPrefix) {
  auto ss = std::stringstream{};
  hexPrint(ss, data, size, withPrefix);
  return ss.str();
}

std::vector<uint8_t> unhex(const std::string &hex) {
  auto start = std::string::size_type{0};
  if (hex.rfind("0x", 0) == 0 || hex.rfind("0X", 0) == 0) {
    start = 2;
  }
  const auto digits = hex.size() - start;
  if (digits % 2) {
    throw std::invalid_argument{"Invalid hex string: " + hex};
  }
  if (hex.find_first_not_of("0123456789abcdefABCDEF", start) != std::string::npos) {
    throw std::invalid_argument{"Invalid hex string: " + hex};
  }

  std::vector<uint8_t> output;
  output.reserve(digits / 2);
  for (auto i = start; i < hex.size(); i += 2) {
    output.push_back(static_cast<uint8_t>(std::stoul(hex.substr(i, 2), nullptr, 16)));
  }
  return output;
}

}  // namespace voile::util
