// Cloak
//
// Copyright (c) 2024 VMware, Inc. All Rights Reserved.
//
// This product is licensed to you under the Apache 2.0 license (the "License").
// You may not use this product except in compliance with the Apache 2.0
// License.
//
// This product may include a number of subcomponents with separate copyright
// notices and license terms. Your use of these subcomponents is subject to the
// terms and conditions of the subcomponent's license, as noted in the LICENSE
// file.

#pragma once

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <stdexcept>
#include <string>

namespace cloak {
namespace util {

// Conversions used by the configuration parser. They throw std::invalid_argument or std::out_of_range on bad input.
template <typename T>
T to(const std::string& s) = delete;

template <>
inline bool to<>(const std::string& s) {
  if (s == "true" || s == "1") return true;
  if (s == "false" || s == "0") return false;
  throw std::invalid_argument("not a boolean: " + s);
}
template <>
inline std::int32_t to<>(const std::string& s) {
  return std::stoi(s);
}
template <>
inline std::uint32_t to<>(const std::string& s) {
  if (!s.empty() && s[0] == '-') throw std::invalid_argument("negative value: " + s);
  const auto v = std::stoull(s);
  if (v > UINT32_MAX) throw std::out_of_range("value does not fit in 32 bits: " + s);
  return static_cast<std::uint32_t>(v);
}
template <>
inline std::uint64_t to<>(const std::string& s) {
  if (!s.empty() && s[0] == '-') throw std::invalid_argument("negative value: " + s);
  return std::stoull(s);
}
template <>
inline std::string to<>(const std::string& s) {
  return s;
}

inline std::string& ltrim_inplace(std::string& s) {
  s.erase(s.begin(), std::find_if(s.begin(), s.end(), [](unsigned char ch) { return !std::isspace(ch); }));
  return s;
}
inline std::string& rtrim_inplace(std::string& s) {
  s.erase(std::find_if(s.rbegin(), s.rend(), [](unsigned char ch) { return !std::isspace(ch); }).base(), s.end());
  return s;
}
inline std::string& trim_inplace(std::string& str) { return ltrim_inplace(rtrim_inplace(str)); }
inline std::string ltrim(const std::string& s) {
  auto it = std::find_if(s.begin(), s.end(), [](unsigned char ch) { return !std::isspace(ch); });
  return std::string(it, s.end());
}
inline std::string rtrim(const std::string& s) {
  auto it = std::find_if(s.rbegin(), s.rend(), [](unsigned char ch) { return !std::isspace(ch); });
  return std::string(s.begin(), it.base());
}

inline bool isValidHexString(const std::string& str) {
  return str.length() % 2 == 0 && (str.find_first_not_of("0123456789abcdefABCDEF") == std::string::npos);
}

}  // namespace util
}  // namespace cloak
