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

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string>
#include <vector>

namespace voile {
namespace util {

// Converts a configuration value to T. Only the types that configuration keys use are specialized.
template <typename T>
T to(const std::string& s) = delete;

template <>
inline bool to<>(const std::string& s) {
  if (s == "true" || s == "1") return true;
  if (s == "false" || s == "0") return false;
  throw std::invalid_argument("not a boolean: " + s);
}
namespace detail {

// Parses a non-negative integer no larger than max. std::stoull accepts and negates a leading
// '-', so that is rejected here.
inline unsigned long long toUnsigned(const std::string& s, unsigned long long max) {
  const auto first = std::find_if(s.begin(), s.end(), [](int ch) { return !std::isspace(ch); });
  if (first != s.end() && *first == '-') throw std::out_of_range("negative value: " + s);
  const auto value = std::stoull(s);
  if (value > max) throw std::out_of_range("value too large: " + s);
  return value;
}

}  // namespace detail

template <>
inline std::uint16_t to<>(const std::string& s) {
  return static_cast<std::uint16_t>(detail::toUnsigned(s, std::numeric_limits<std::uint16_t>::max()));
}
template <>
inline std::uint32_t to<>(const std::string& s) {
  return static_cast<std::uint32_t>(detail::toUnsigned(s, std::numeric_limits<std::uint32_t>::max()));
}
template <>
inline unsigned long to<>(const std::string& s) {
  return static_cast<unsigned long>(detail::toUnsigned(s, std::numeric_limits<unsigned long>::max()));
}
template <>
inline unsigned long long to<>(const std::string& s) {
  return detail::toUnsigned(s, std::numeric_limits<unsigned long long>::max());
}
template <>
inline std::string to<>(const std::string& s) {
  return s;
}

inline std::string& ltrim_inplace(std::string& s) {
  s.erase(s.begin(), std::find_if(s.begin(), s.end(), [](int ch) { return !std::isspace(ch); }));
  return s;
}
inline std::string& rtrim_inplace(std::string& s) {
  s.erase(std::find_if(s.rbegin(), s.rend(), [](int ch) { return !std::isspace(ch); }).base(), s.end());
  return s;
}
inline std::string& trim_inplace(std::string& str) { return ltrim_inplace(rtrim_inplace(str)); }

// Splits on every occurrence of delimiter, keeping empty tokens.
inline std::vector<std::string> split(const std::string& s, char delimiter) {
  std::vector<std::string> out;
  std::string::size_type start = 0;
  while (true) {
    const auto pos = s.find(delimiter, start);
    if (pos == std::string::npos) {
      out.push_back(s.substr(start));
      return out;
    }
    out.push_back(s.substr(start, pos - start));
    start = pos + 1;
  }
}

}  // namespace util
}  // namespace voile
