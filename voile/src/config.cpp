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

#include "voile/config.hpp"

#include "Logger.hpp"
#include "config_file_parser.hpp"
#include "kvstream.h"
#include "voile/errors.hpp"

namespace voile {

namespace {

template <typename T>
T readOptional(const util::ConfigFileParser& parser, const std::string& key, const T& defaultValue) {
  try {
    return parser.get_optional_value<T>(key, defaultValue);
  } catch (const std::logic_error& e) {
    // std::stoul and friends report bad numbers as invalid_argument or out_of_range.
    throw ConfigError("bad value for '" + key + "': " + e.what());
  }
}

NullifierStoreType parseStoreType(const std::string& value) {
  if (value == "memory") return NullifierStoreType::Memory;
  if (value == "rocksdb") return NullifierStoreType::RocksDb;
  throw ConfigError("unknown nullifier_store '" + value + "', expected memory or rocksdb");
}

}  // namespace

VerifierConfig VerifierConfig::loadFromFile(const std::string& path) {
  util::ConfigFileParser parser(CONFIG_LOG, path);
  try {
    parser.parse();
  } catch (const util::ConfigFileParser::ParseError&) {
    throw;
  } catch (const std::runtime_error& e) {
    throw ConfigError(e.what());
  }

  VerifierConfig config;
  if (parser.count("domain_separator") == 0) throw ConfigError("missing required key 'domain_separator'");
  config.domain_separator = parser.get_value<std::string>("domain_separator");
  config.nullifier_store = parseStoreType(readOptional<std::string>(parser, "nullifier_store", "memory"));
  config.rocksdb_path = readOptional<std::string>(parser, "rocksdb_path", "");
  config.persistence_timeout_ms =
      readOptional<std::uint32_t>(parser, "persistence_timeout_ms", config.persistence_timeout_ms);
  config.persistence_threads = readOptional<std::uint32_t>(parser, "persistence_threads", config.persistence_threads);
  config.log_config = readOptional<std::string>(parser, "log_config", "");
  config.validate();

  LOG_INFO(CONFIG_LOG,
           "loaded verifier configuration" << KVLOG(path,
                                                    config.domain_separator,
                                                    config.rocksdb_path,
                                                    config.persistence_timeout_ms,
                                                    config.persistence_threads));
  return config;
}

void VerifierConfig::validate() const {
  if (domain_separator.empty()) throw ConfigError("domain_separator must not be empty");
  if (nullifier_store == NullifierStoreType::RocksDb && rocksdb_path.empty()) {
    throw ConfigError("rocksdb_path is required when nullifier_store is rocksdb");
  }
  if (persistence_timeout_ms == 0) throw ConfigError("persistence_timeout_ms must be greater than zero");
  if (persistence_threads == 0) throw ConfigError("persistence_threads must be greater than zero");
  if (persistence_threads > kMaxPersistenceThreads) {
    throw ConfigError("persistence_threads must not exceed " + std::to_string(kMaxPersistenceThreads));
  }
}

}  // namespace voile
