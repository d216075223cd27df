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

#include <chrono>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <ostream>
#include <vector>

#include "commitment.hpp"
#include "config.hpp"
#include "domain.hpp"
#include "nullifier_store.hpp"
#include "proof.hpp"
#include "thread_pool.hpp"

namespace voile {

enum class VerifyStatus { Ok, BadTag, NullifierReused };

std::ostream& operator<<(std::ostream& os, VerifyStatus s);

// Checks exit proofs against registered commitments and guards against double spends.
//
// Owners register (commitment, owner binding) pairs up front. A proof passes when its tag matches
// one of the bindings registered for its commitment and its nullifier has not been consumed.
//
// All registry and store access is serialized by one mutex. Nullifier writes run on a worker pool
// outside that mutex. While a write is pending its nullifier is in flight: verification treats it
// as spent, and callers asking whether it is recorded wait for the store's answer. A write that does
// not finish within the persistence timeout raises NullifierPersistenceTimeout and stays in flight
// until the store answers.
class ProofVerifier {
 public:
  ProofVerifier(DomainSeparator domain,
                std::unique_ptr<INullifierStore> store,
                std::chrono::milliseconds persistence_timeout = std::chrono::milliseconds{5000},
                unsigned int persistence_threads = 1);

  // Builds the domain and store from config.
  explicit ProofVerifier(const VerifierConfig& config);

  ProofVerifier(const ProofVerifier&) = delete;
  ProofVerifier& operator=(const ProofVerifier&) = delete;

  // Registering the same pair twice is a no-op.
  void registerCommitment(const Commitment& commitment, const OwnerBinding& binding);

  // Read-only check. Does not consume the nullifier.
  VerifyStatus verify(const ExitProof& proof) const;

  // Commits a nullifier as spent. Idempotent. AlreadyPresent is only returned once the store holds
  // the nullifier; a pending write for it is awaited. Throws NullifierPersistenceError or
  // NullifierPersistenceTimeout if the store write fails or stalls.
  InsertResult markNullifierUsed(const Nullifier& nullifier);

  // verify() followed by markNullifierUsed() as one atomic step. Returns Ok only after the
  // nullifier is durably stored.
  VerifyStatus verifyAndConsume(const ExitProof& proof);

  // True when the store holds the nullifier. Waits for a pending write of it.
  bool isNullifierUsed(const Nullifier& nullifier) const;

  const DomainSeparator& domain() const { return domain_; }

 private:
  bool tagMatches(const ExitProof& proof) const;
  bool stored(const Nullifier& nullifier) const;
  bool spent(const Nullifier& nullifier) const;
  std::shared_future<InsertResult> startWrite(const Nullifier& nullifier);
  InsertResult awaitWrite(const std::shared_future<InsertResult>& write) const;
  void finishInFlight(const Nullifier& nullifier);

  const DomainSeparator domain_;
  const std::unique_ptr<INullifierStore> store_;
  const std::chrono::milliseconds persistence_timeout_;

  mutable std::mutex mutex_;
  std::map<Commitment, std::vector<OwnerBinding>> registry_;
  std::map<Nullifier, std::shared_future<InsertResult>> in_flight_;

  // Declared last so its workers are joined before the members they touch are destroyed.
  util::ThreadPool pool_;
};

}  // namespace voile
