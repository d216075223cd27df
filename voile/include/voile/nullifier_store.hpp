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

#include <memory>
#include <mutex>
#include <ostream>
#include <unordered_set>

#include "types.hpp"

namespace voile {

struct VerifierConfig;

enum class InsertResult { Inserted, AlreadyPresent };

std::ostream& operator<<(std::ostream& os, InsertResult r);

// The set of consumed nullifiers. It only ever grows. Implementations must be thread safe and
// must have made an insert durable before returning from insert().
class INullifierStore {
 public:
  virtual ~INullifierStore() = default;

  virtual bool contains(const Nullifier& nullifier) const = 0;

  // Idempotent: inserting a present nullifier returns AlreadyPresent.
  virtual InsertResult insert(const Nullifier& nullifier) = 0;
};

struct NullifierHash {
  size_t operator()(const Nullifier& n) const noexcept {
    // Nullifiers are uniformly distributed hash outputs.
    size_t h = 0;
    for (size_t i = 0; i < sizeof(h); ++i) h = (h << 8) | n[i];
    return h;
  }
};

class InMemoryNullifierStore : public INullifierStore {
 public:
  bool contains(const Nullifier& nullifier) const override;
  InsertResult insert(const Nullifier& nullifier) override;
  size_t size() const;

 private:
  mutable std::mutex mutex_;
  std::unordered_set<Nullifier, NullifierHash> nullifiers_;
};

// Builds the store selected by config.nullifier_store. Throws ConfigError if RocksDB was
// requested but the library was built without it.
std::unique_ptr<INullifierStore> makeNullifierStore(const VerifierConfig& config);

}  // namespace voile
