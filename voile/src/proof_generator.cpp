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

#include "voile/proof_generator.hpp"

#include <algorithm>

#include "Logger.hpp"
#include "kvstream.h"
#include "voile/errors.hpp"

namespace voile {

namespace {

Bytes32 checkedSecret(const Bytes& owner_secret) {
  Bytes32 secret;
  if (owner_secret.size() != secret.size()) {
    throw ProofGenerationError("owner secret must be 32 bytes, got " + std::to_string(owner_secret.size()));
  }
  std::copy(owner_secret.begin(), owner_secret.end(), secret.begin());
  return secret;
}

}  // namespace

ExitProof ProofGenerator::generate(const ExitNote& note, const Bytes& owner_secret) const {
  const auto secret = checkedSecret(owner_secret);
  ExitProof proof;
  proof.commitment = note.commitment();
  proof.nullifier = proof_scheme::nullifier(note.id(), secret, domain_);
  const auto challenge = proof_scheme::challenge(proof.commitment, proof.nullifier, domain_);
  proof.tag = proof_scheme::tag(challenge, proof_scheme::ownerBinding(secret, domain_));
  LOG_DEBUG(PROOF_LOG,
            "generated proof" << KVLOG(domain_.label()) << " commitment: " << proof.commitment
                              << " nullifier: " << toHex(proof.nullifier));
  return proof;
}

OwnerBinding ProofGenerator::ownerBinding(const Bytes& owner_secret) const {
  return proof_scheme::ownerBinding(checkedSecret(owner_secret), domain_);
}

}  // namespace voile
