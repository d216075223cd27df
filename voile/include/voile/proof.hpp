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

#include "commitment.hpp"
#include "domain.hpp"
#include "types.hpp"

namespace voile {

// The public artifact an owner hands to a verifier: commitment(32) || nullifier(32) || tag(32).
struct ExitProof {
  static constexpr size_t SIZE = 96;

  Commitment commitment{Bytes32{}};
  Nullifier nullifier{};
  Bytes32 tag{};

  Bytes toBytes() const;

  // 0x-prefixed lowercase hex of toBytes().
  std::string toHex() const;

  // Throw InvalidProof unless the input holds exactly 96 bytes.
  static ExitProof fromBytes(const uint8_t* data, size_t size);
  static ExitProof fromBytes(const Bytes& bytes) { return fromBytes(bytes.data(), bytes.size()); }
  static ExitProof fromHex(const std::string& hex);

  bool operator==(const ExitProof& o) const {
    return commitment == o.commitment && nullifier == o.nullifier && tag == o.tag;
  }
  bool operator!=(const ExitProof& o) const { return !(*this == o); }
};

inline std::ostream& operator<<(std::ostream& os, const ExitProof& p) { return os << p.toHex(); }

// Hash steps shared by the generator and the verifier.
namespace proof_scheme {

// H("voile.nullifier" || note_id || owner_secret || domain)
Nullifier nullifier(const Bytes32& note_id, const Bytes32& owner_secret, const DomainSeparator& domain);

// H("voile.challenge" || commitment || nullifier || domain)
Bytes32 challenge(const Commitment& commitment, const Nullifier& nullifier, const DomainSeparator& domain);

// H("voile.owner-binding" || owner_secret || domain). Public, but capability-bearing: anyone holding
// it can produce valid tags, so it is handed only to verifiers.
OwnerBinding ownerBinding(const Bytes32& owner_secret, const DomainSeparator& domain);

// H("voile.tag" || challenge || binding)
Bytes32 tag(const Bytes32& challenge, const OwnerBinding& binding);

}  // namespace proof_scheme

}  // namespace voile
