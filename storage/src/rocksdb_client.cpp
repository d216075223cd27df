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

#ifdef USE_ROCKSDB

#include "rocksdb/client.h"
#include "rocksdb/details.h"

#include "kvstream.h"

#include <filesystem>

namespace voile::storage::rocksdb {

using detail::throwOnError;
using detail::toSlice;

void Client::init(bool readOnly) {
  ::rocksdb::Options options;
  options.create_if_missing = !readOnly;
  ::rocksdb::DB *db = nullptr;
  if (!readOnly) {
    std::error_code ec;
    std::filesystem::create_directories(path_, ec);
    if (ec) {
      LOG_WARN(logger(), "Failed to create directory " << path_ << ": " << ec.message());
    }
  }
  auto s = readOnly ? ::rocksdb::DB::OpenForReadOnly(options, path_, &db) : ::rocksdb::DB::Open(options, path_, &db);
  throwOnError("open failed"sv, path_, std::move(s));
  db_.reset(db);
  LOG_INFO(logger(), "RocksDB opened" << KVLOG(path_, readOnly));
}

std::optional<std::string> Client::get(const std::string &key) const {
  std::string value;
  auto s = db_->Get(::rocksdb::ReadOptions{}, toSlice(key), &value);
  if (s.IsNotFound()) return std::nullopt;
  throwOnError("get() failed"sv, std::move(s));
  return value;
}

void Client::put(const std::string &key, const std::string &value, bool sync) {
  ::rocksdb::WriteOptions woptions;
  woptions.sync = sync;
  throwOnError("put() failed"sv, db_->Put(woptions, toSlice(key), toSlice(value)));
}

void Client::del(const std::string &key, bool sync) {
  ::rocksdb::WriteOptions woptions;
  woptions.sync = sync;
  throwOnError("del() failed"sv, db_->Delete(woptions, toSlice(key)));
}

}  // namespace voile::storage::rocksdb

#endif  // USE_ROCKSDB
