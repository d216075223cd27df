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

#include <utility>

#include "domain.hpp"
#include "exit_note.hpp"
#include "proof.hpp"

namespace voile {

// Builds exit proofs for one deployment domain. Holds no mutable state, so one instance may be
// shared between threads.
class ProofGenerator {
 public:
  explicit ProofGenerator(DomainSeparator domain = DomainSeparator{}) : domain_{std::move(domain)} {}

  // Throws ProofGenerationError if owner_secret is not exactly 32 bytes.
  ExitProof generate(const ExitNote& note, const Bytes& owner_secret) const;

  // The public binding the owner registers with verifiers alongside the note commitment.
  OwnerBinding ownerBinding(const Bytes& owner_secret) const;

  const DomainSeparator& domain() const { return domain_; }

 private:
  DomainSeparator domain_;
};

}  // namespace voile
