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

#include <string>
#include <string_view>

#include "types.hpp"

namespace voile {

// Domain used when a deployment does not configure its own.
inline constexpr std::string_view kDefaultDomain = "voile_mainnet";

// A deployment-specific byte string mixed into every nullifier, challenge and binding hash,
// so proofs produced for one deployment never verify in another.
class DomainSeparator {
 public:
  explicit DomainSeparator(std::string_view label = kDefaultDomain);

  const std::string& label() const { return label_; }

  // H("voile.domain" || label)
  const Bytes32& digest() const { return digest_; }

  bool operator==(const DomainSeparator& other) const { return digest_ == other.digest_; }
  bool operator!=(const DomainSeparator& other) const { return !(*this == other); }

 private:
  std::string label_;
  Bytes32 digest_;
};

}  // namespace voile
