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

#include "Logger.hpp"

#include <rocksdb/db.h>

#include <memory>
#include <optional>
#include <string>

namespace voile::storage::rocksdb {

// Minimal owner of a RocksDB database handle. All operations throw RocksDBException on failure.
class Client {
 public:
  explicit Client(std::string path) : path_(std::move(path)) {}

  // Opens (creating if missing) the database at the configured path.
  void init(bool readOnly = false);

  // Returns std::nullopt if the key is not present.
  std::optional<std::string> get(const std::string& key) const;

  // With sync=true the write is flushed to the WAL on disk before returning.
  void put(const std::string& key, const std::string& value, bool sync);

  void del(const std::string& key, bool sync);

  const std::string& path() const { return path_; }

  static logging::Logger& logger() {
    static logging::Logger logger_ = logging::getLogger("voile.storage.rocksdb");
    return logger_;
  }

 private:
  std::string path_;
  std::unique_ptr<::rocksdb::DB> db_;
};

}  // namespace voile::storage::rocksdb

#endif  // USE_ROCKSDB
