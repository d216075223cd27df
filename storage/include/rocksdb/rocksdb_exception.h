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

#include <rocksdb/status.h>

#include <stdexcept>
#include <string>

namespace voile::storage::rocksdb {

// Thrown by the RocksDB client on any non-OK status. Carries the original status for inspection.
class RocksDBException : public std::runtime_error {
 public:
  RocksDBException(const std::string& what, ::rocksdb::Status&& status)
      : std::runtime_error{what}, status_{std::move(status)} {}

  const ::rocksdb::Status& status() const noexcept { return status_; }

 private:
  ::rocksdb::Status status_;
};

}  // namespace voile::storage::rocksdb

#endif  // USE_ROCKSDB
