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

#include "config_file_parser.hpp"

#include <fstream>

using std::getline;
using std::ifstream;
using std::string;

namespace voile::util {

void ConfigFileParser::parse() {
  ifstream stream(file_, std::ios::binary);
  if (!stream.is_open()) throw std::runtime_error("failed to open file: " + file_.string());

  string key;
  std::uint16_t line_no = 0;
  string line;
  while (getline(stream, line, end_of_line_)) {
    line_no++;
    trim_inplace(line);
    if (line.empty()) {
      LOG_TRACE(logger_, "line:" << line_no << " EMPTY LINE");
      continue;
    }
    if (line[0] == comment_delimiter_) {
      LOG_TRACE(logger_, "line:" << line_no << " COMMENT");
      continue;
    }

    if (line[0] == value_delimiter_) {  // of the form '- value'
      string value = line.substr(1);
      ltrim_inplace(value);
      LOG_TRACE(logger_, "line:" << line_no << " value: " << value);
      if (key.empty()) throw ParseError(file_, line_no, "not found key for value: " + value);
      parameters_map_.emplace(key, value);
      continue;
    }

    const size_t keyDelimiterPos = line.find(key_delimiter_);
    if (keyDelimiterPos == string::npos || keyDelimiterPos == 0) {
      throw ParseError(file_, line_no, "unrecognized format: " + line);
    }
    key = line.substr(0, keyDelimiterPos);
    rtrim_inplace(key);
    string value = line.substr(keyDelimiterPos + 1);
    ltrim_inplace(value);
    LOG_TRACE(logger_, "line:" << line_no << " key: " << key);
    if (!value.empty()) {  // simple key-value pair
      parameters_map_.emplace(key, value);
      key.clear();
    }
  }
  LOG_DEBUG(logger_, "File: " << file_ << " successfully parsed.");
}

size_t ConfigFileParser::count(const string& key) const {
  size_t res = parameters_map_.count(key);
  LOG_TRACE(logger_, "count() returns: " << res << " for key: " << key);
  return res;
}

}  // namespace voile::util
