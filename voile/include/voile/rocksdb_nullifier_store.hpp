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

#ifdef USE_ROCKSDB

#include <memory>
#include <string>

#include "nullifier_store.hpp"
#include "rocksdb/client.h"

namespace voile {

// Persists nullifiers as keys 'N' || nullifier with an empty value. Writes are synchronous.
// Lookups read through to the database; nothing is cached in memory.
class RocksDbNullifierStore : public INullifierStore {
 public:
  static constexpr char KEY_PREFIX = 'N';

  // Opens or creates the database. Throws storage::rocksdb::RocksDBException on failure.
  explicit RocksDbNullifierStore(const std::string& path);

  bool contains(const Nullifier& nullifier) const override;
  InsertResult insert(const Nullifier& nullifier) override;

 private:
  static std::string key(const Nullifier& nullifier);

  // Serializes the read-then-write in insert().
  std::mutex write_mutex_;
  std::unique_ptr<storage::rocksdb::Client> db_;
};

}  // namespace voile

#endif  // USE_ROCKSDB
