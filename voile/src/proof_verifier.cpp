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

#include "voile/proof_verifier.hpp"

#include <algorithm>
#include <future>

#include "Logger.hpp"
#include "kvstream.h"
#include "openssl_crypto.hpp"
#include "scope_exit.hpp"
#include "voile/errors.hpp"

namespace voile {

namespace {

const VerifierConfig& validated(const VerifierConfig& config) {
  config.validate();
  return config;
}

}  // namespace

std::ostream& operator<<(std::ostream& os, VerifyStatus s) {
  switch (s) {
    case VerifyStatus::Ok:
      return os << "Ok";
    case VerifyStatus::BadTag:
      return os << "BadTag";
    case VerifyStatus::NullifierReused:
      return os << "NullifierReused";
  }
  return os;
}

ProofVerifier::ProofVerifier(DomainSeparator domain,
                             std::unique_ptr<INullifierStore> store,
                             std::chrono::milliseconds persistence_timeout,
                             unsigned int persistence_threads)
    : domain_{std::move(domain)},
      store_{std::move(store)},
      persistence_timeout_{persistence_timeout},
      pool_{persistence_threads} {
  VoileAssert(store_ != nullptr);
  LOG_INFO(VERIFIER_LOG,
           "verifier started" << KVLOG(domain_.label(), persistence_timeout_.count(), persistence_threads));
}

ProofVerifier::ProofVerifier(const VerifierConfig& config)
    : ProofVerifier{DomainSeparator{validated(config).domain_separator},
                    makeNullifierStore(config),
                    std::chrono::milliseconds{config.persistence_timeout_ms},
                    config.persistence_threads} {}

void ProofVerifier::registerCommitment(const Commitment& commitment, const OwnerBinding& binding) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto& bindings = registry_[commitment];
  if (std::find(bindings.begin(), bindings.end(), binding) == bindings.end()) {
    bindings.push_back(binding);
    LOG_DEBUG(VERIFIER_LOG, "registered binding for commitment " << commitment << KVLOG(bindings.size()));
  }
}

// Caller holds mutex_.
bool ProofVerifier::tagMatches(const ExitProof& proof) const {
  const auto it = registry_.find(proof.commitment);
  if (it == registry_.end()) {
    LOG_DEBUG(VERIFIER_LOG, "unknown commitment " << proof.commitment);
    return false;
  }
  const auto challenge = proof_scheme::challenge(proof.commitment, proof.nullifier, domain_);
  bool match = false;
  // Every binding is checked so the time taken does not reveal which one matched.
  for (const auto& binding : it->second) {
    const auto expected = proof_scheme::tag(challenge, binding);
    match |= util::openssl_utils::constantTimeEqual(expected.data(), proof.tag.data(), expected.size());
  }
  return match;
}

// Caller holds mutex_.
bool ProofVerifier::stored(const Nullifier& nullifier) const {
  try {
    return store_->contains(nullifier);
  } catch (const std::exception& e) {
    LOG_ERROR(VERIFIER_LOG, "nullifier store lookup failed: " << e.what());
    throw NullifierPersistenceError(e.what());
  }
}

// Caller holds mutex_.
bool ProofVerifier::spent(const Nullifier& nullifier) const {
  return in_flight_.count(nullifier) || stored(nullifier);
}

VerifyStatus ProofVerifier::verify(const ExitProof& proof) const {
  SCOPED_MDC_NULLIFIER(toHex(proof.nullifier));
  SCOPED_MDC_COMMITMENT(proof.commitment.toHex());
  std::lock_guard<std::mutex> lock(mutex_);
  if (!tagMatches(proof)) return VerifyStatus::BadTag;
  if (spent(proof.nullifier)) {
    LOG_WARN(VERIFIER_LOG, "nullifier reuse detected for commitment " << proof.commitment);
    return VerifyStatus::NullifierReused;
  }
  return VerifyStatus::Ok;
}

InsertResult ProofVerifier::markNullifierUsed(const Nullifier& nullifier) {
  SCOPED_MDC_NULLIFIER(toHex(nullifier));
  std::shared_future<InsertResult> write;
  bool own_write = false;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = in_flight_.find(nullifier);
    if (it != in_flight_.end()) {
      write = it->second;
    } else {
      if (stored(nullifier)) return InsertResult::AlreadyPresent;
      write = startWrite(nullifier);
      own_write = true;
    }
  }
  const auto result = awaitWrite(write);
  // A write started by another caller counts as ours only once the store confirmed it.
  return own_write ? result : InsertResult::AlreadyPresent;
}

VerifyStatus ProofVerifier::verifyAndConsume(const ExitProof& proof) {
  SCOPED_MDC_NULLIFIER(toHex(proof.nullifier));
  SCOPED_MDC_COMMITMENT(proof.commitment.toHex());
  std::shared_future<InsertResult> write;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!tagMatches(proof)) return VerifyStatus::BadTag;
    if (spent(proof.nullifier)) {
      LOG_WARN(VERIFIER_LOG, "nullifier reuse detected for commitment " << proof.commitment);
      return VerifyStatus::NullifierReused;
    }
    write = startWrite(proof.nullifier);
  }
  if (awaitWrite(write) == InsertResult::AlreadyPresent) {
    // Another verifier sharing the durable store consumed it first.
    LOG_WARN(VERIFIER_LOG, "nullifier reuse detected in store for commitment " << proof.commitment);
    return VerifyStatus::NullifierReused;
  }
  LOG_INFO(VERIFIER_LOG, "exit proof accepted for commitment " << proof.commitment);
  return VerifyStatus::Ok;
}

bool ProofVerifier::isNullifierUsed(const Nullifier& nullifier) const {
  std::shared_future<InsertResult> write;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = in_flight_.find(nullifier);
    if (it == in_flight_.end()) return stored(nullifier);
    write = it->second;
  }
  try {
    awaitWrite(write);
    return true;
  } catch (const NullifierPersistenceError&) {
    // The pending write was lost. Report what the store actually holds.
    std::lock_guard<std::mutex> lock(mutex_);
    return stored(nullifier);
  }
}

void ProofVerifier::finishInFlight(const Nullifier& nullifier) {
  std::lock_guard<std::mutex> lock(mutex_);
  in_flight_.erase(nullifier);
}

// Caller holds mutex_. The worker blocks on mutex_ to clear the entry, so the entry is always
// recorded before it can be cleared.
std::shared_future<InsertResult> ProofVerifier::startWrite(const Nullifier& nullifier) {
  auto write = pool_
                   .async([this, nullifier]() {
                     auto clear = util::ScopeExit{[this, &nullifier]() { finishInFlight(nullifier); }};
                     return store_->insert(nullifier);
                   })
                   .share();
  in_flight_.emplace(nullifier, write);
  return write;
}

InsertResult ProofVerifier::awaitWrite(const std::shared_future<InsertResult>& write) const {
  if (write.wait_for(persistence_timeout_) != std::future_status::ready) {
    LOG_ERROR(VERIFIER_LOG, "nullifier write did not finish within " << persistence_timeout_.count() << "ms");
    throw NullifierPersistenceTimeout("no answer from nullifier store within " +
                                      std::to_string(persistence_timeout_.count()) + "ms");
  }
  try {
    const auto result = write.get();
    LOG_DEBUG(VERIFIER_LOG, "nullifier persisted" << KVLOG(result));
    return result;
  } catch (const std::exception& e) {
    LOG_ERROR(VERIFIER_LOG, "nullifier write failed: " << e.what());
    throw NullifierPersistenceError(e.what());
  }
}

}  // namespace voile
