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
//
// Parser for the flat YAML subset used by Voile configuration files:
//   key: value
//   key:
//     - value1
//     - value2
// Lines starting with '#' are comments.

#pragma once

#include <filesystem>
#include <map>
#include <stdexcept>
#include <string>
#include <vector>

#include "Logger.hpp"
#include "string.hpp"

namespace voile::util {

namespace fs = std::filesystem;

class ConfigFileParser {
  typedef std::multimap<std::string, std::string> ParamsMultiMap;
  typedef ParamsMultiMap::const_iterator ParamsMultiMapIt;

 public:
  class ParseError : public std::runtime_error {
   public:
    ParseError(const fs::path& file, std::uint16_t line, const std::string& what)
        : std::runtime_error("parse error: " + file.string() + ": " + std::to_string(line) + " reason: " + what) {}
  };

  ConfigFileParser(logging::Logger& logger, fs::path file) : file_(std::move(file)), logger_(logger) {}
  virtual ~ConfigFileParser() = default;

  // Throws std::runtime_error if the file cannot be opened and ParseError on malformed lines.
  void parse();

  size_t count(const std::string& key) const;

  template <typename T>
  std::vector<T> get_values(const std::string& key) const {
    std::vector<T> values;
    auto range = parameters_map_.equal_range(key);
    LOG_TRACE(logger_, "key: " << key);
    for (auto it = range.first; it != range.second; ++it) {
      values.push_back(to<T>(it->second));
      LOG_TRACE(logger_, "value: " << it->second);
    }
    return values;
  }

  template <typename T>
  T get_optional_value(const std::string& key, const T& defaultValue) const {
    std::vector<T> v = get_values<T>(key);
    if (v.size())
      return v[0];
    else
      return defaultValue;
  }

  template <typename T>
  T get_value(const std::string& key) const {
    std::vector<T> v = get_values<T>(key);
    if (v.size())
      return v[0];
    else
      throw std::runtime_error("failed to get value for key: " + key);
  }

 protected:
  static const char key_delimiter_ = ':';
  static const char value_delimiter_ = '-';
  static const char comment_delimiter_ = '#';
  static const char end_of_line_ = '\n';

  fs::path file_;
  ParamsMultiMap parameters_map_;
  logging::Logger& logger_;
};

}  // namespace voile::util
