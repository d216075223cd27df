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

#include "voile/nullifier_store.hpp"

#include "Logger.hpp"
#include "voile/config.hpp"
#include "voile/errors.hpp"
#ifdef USE_ROCKSDB
#include "voile/rocksdb_nullifier_store.hpp"
#endif

namespace voile {

std::ostream& operator<<(std::ostream& os, InsertResult r) {
  switch (r) {
    case InsertResult::Inserted:
      return os << "Inserted";
    case InsertResult::AlreadyPresent:
      return os << "AlreadyPresent";
  }
  return os;
}

bool InMemoryNullifierStore::contains(const Nullifier& nullifier) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return nullifiers_.count(nullifier) > 0;
}

InsertResult InMemoryNullifierStore::insert(const Nullifier& nullifier) {
  std::lock_guard<std::mutex> lock(mutex_);
  return nullifiers_.insert(nullifier).second ? InsertResult::Inserted : InsertResult::AlreadyPresent;
}

size_t InMemoryNullifierStore::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return nullifiers_.size();
}

#ifdef USE_ROCKSDB

RocksDbNullifierStore::RocksDbNullifierStore(const std::string& path)
    : db_{std::make_unique<storage::rocksdb::Client>(path)} {
  db_->init();
}

std::string RocksDbNullifierStore::key(const Nullifier& nullifier) {
  std::string k;
  k.reserve(1 + nullifier.size());
  k.push_back(KEY_PREFIX);
  k.append(reinterpret_cast<const char*>(nullifier.data()), nullifier.size());
  return k;
}

bool RocksDbNullifierStore::contains(const Nullifier& nullifier) const { return db_->get(key(nullifier)).has_value(); }

InsertResult RocksDbNullifierStore::insert(const Nullifier& nullifier) {
  std::lock_guard<std::mutex> lock(write_mutex_);
  const auto k = key(nullifier);
  if (db_->get(k)) return InsertResult::AlreadyPresent;
  db_->put(k, std::string{}, true);
  return InsertResult::Inserted;
}

#endif  // USE_ROCKSDB

std::unique_ptr<INullifierStore> makeNullifierStore(const VerifierConfig& config) {
  switch (config.nullifier_store) {
    case NullifierStoreType::Memory:
      LOG_INFO(STORAGE_LOG, "using in-memory nullifier store");
      return std::make_unique<InMemoryNullifierStore>();
    case NullifierStoreType::RocksDb:
#ifdef USE_ROCKSDB
      LOG_INFO(STORAGE_LOG, "using RocksDB nullifier store at " << config.rocksdb_path);
      return std::make_unique<RocksDbNullifierStore>(config.rocksdb_path);
#else
      throw ConfigError("nullifier_store rocksdb requested but RocksDB support is not built in");
#endif
  }
  throw ConfigError("unknown nullifier store type");
}

}  // namespace voile
