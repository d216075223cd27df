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

#include <cstdint>
#include <string>

#include "domain.hpp"

namespace voile {

enum class NullifierStoreType { Memory, RocksDb };

// Verifier settings, usually read from a YAML-subset file:
//
//   domain_separator: voile_mainnet
//   nullifier_store: rocksdb
//   rocksdb_path: /var/lib/voile/nullifiers
//   persistence_timeout_ms: 5000
//   persistence_threads: 1
//   log_config: /etc/voile/log4cplus.properties
// Upper bound for persistence_threads.
constexpr uint32_t kMaxPersistenceThreads = 64;

struct VerifierConfig {
  std::string domain_separator{kDefaultDomain};
  NullifierStoreType nullifier_store = NullifierStoreType::Memory;
  std::string rocksdb_path;
  uint32_t persistence_timeout_ms = 5000;
  uint32_t persistence_threads = 1;
  std::string log_config;

  // Throws ConfigError on missing or invalid values. Syntax errors surface as
  // util::ConfigFileParser::ParseError.
  static VerifierConfig loadFromFile(const std::string& path);

  // Throws ConfigError if the values are inconsistent.
  void validate() const;
};

}  // namespace voile
