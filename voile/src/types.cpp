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

#include "voile/types.hpp"

#include <algorithm>
#include <stdexcept>

namespace voile {

Bytes32 bytes32FromHex(const std::string& hex) {
  const auto bytes = util::unhex(hex);
  Bytes32 out;
  if (bytes.size() != out.size()) {
    throw std::invalid_argument("expected 32 bytes of hex, got " + std::to_string(bytes.size()));
  }
  std::copy(bytes.begin(), bytes.end(), out.begin());
  return out;
}

}  // namespace voile
