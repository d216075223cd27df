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

#include "voile/proof.hpp"

#include <algorithm>

#include "voile/errors.hpp"

namespace voile {

Bytes ExitProof::toBytes() const {
  Bytes out;
  out.reserve(SIZE);
  out.insert(out.end(), commitment.bytes().begin(), commitment.bytes().end());
  out.insert(out.end(), nullifier.begin(), nullifier.end());
  out.insert(out.end(), tag.begin(), tag.end());
  return out;
}

std::string ExitProof::toHex() const { return util::toHex(toBytes(), true); }

ExitProof ExitProof::fromBytes(const uint8_t* data, size_t size) {
  if (size != SIZE) throw InvalidProof("expected 96 bytes, got " + std::to_string(size));
  ExitProof proof;
  Bytes32 c;
  std::copy(data, data + 32, c.begin());
  proof.commitment = Commitment{c};
  std::copy(data + 32, data + 64, proof.nullifier.begin());
  std::copy(data + 64, data + 96, proof.tag.begin());
  return proof;
}

ExitProof ExitProof::fromHex(const std::string& hex) {
  Bytes bytes;
  try {
    bytes = util::unhex(hex);
  } catch (const std::invalid_argument& e) {
    throw InvalidProof(e.what());
  }
  return fromBytes(bytes);
}

namespace proof_scheme {

Nullifier nullifier(const Bytes32& note_id, const Bytes32& owner_secret, const DomainSeparator& domain) {
  return LabeledHash{"voile.nullifier"}.add(note_id).add(owner_secret).add(domain.digest()).finish();
}

Bytes32 challenge(const Commitment& commitment, const Nullifier& nullifier, const DomainSeparator& domain) {
  return LabeledHash{"voile.challenge"}.add(commitment.bytes()).add(nullifier).add(domain.digest()).finish();
}

OwnerBinding ownerBinding(const Bytes32& owner_secret, const DomainSeparator& domain) {
  return LabeledHash{"voile.owner-binding"}.add(owner_secret).add(domain.digest()).finish();
}

Bytes32 tag(const Bytes32& challenge, const OwnerBinding& binding) {
  return LabeledHash{"voile.tag"}.add(challenge).add(binding).finish();
}

}  // namespace proof_scheme

}  // namespace voile
