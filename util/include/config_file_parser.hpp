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
//
// Parser for the flat YAML subset used by cloak configuration files:
//
//   # comment
//   key: value
//   list_key:
//     - value1
//     - value2

#pragma once

#include <filesystem>
#include <map>
#include <stdexcept>
#include <string>
#include <vector>

#include "Logger.hpp"
#include "kvstream.h"
#include "string.hpp"

namespace cloak::util {

class ConfigFileParser {
  typedef std::multimap<std::string, std::string> ParamsMultiMap;
  typedef ParamsMultiMap::const_iterator ParamsMultiMapIt;

 public:
  class ParseError : public std::runtime_error {
   public:
    ParseError(const std::filesystem::path& file, std::uint32_t line, const std::string& what)
        : std::runtime_error("parse error: " + file.string() + ": " + std::to_string(line) + " reason: " + what) {}
  };

  // Thrown when a value is present but cannot be converted to the requested type.
  class ValueError : public std::runtime_error {
   public:
    ValueError(const std::string& key, const std::string& value, const std::string& what)
        : std::runtime_error("bad value for key " + key + ": '" + value + "' (" + what + ")") {}
  };

  ConfigFileParser(logging::Logger& logger, std::filesystem::path file) : file_(std::move(file)), logger_(logger) {}
  virtual ~ConfigFileParser() = default;

  void parse();

  // Returns the number of elements matching specific key.
  size_t count(const std::string& key) const;

  // Returns all values stored under the key, in file order.
  template <typename T>
  std::vector<T> get_values(const std::string& key) const {
    std::vector<T> values;
    auto range = parameters_map_.equal_range(key);
    for (auto it = range.first; it != range.second; ++it) {
      LOG_TRACE(logger_, KVLOG(key, it->second));
      try {
        values.push_back(to<T>(it->second));
      } catch (const std::logic_error& e) {
        throw ValueError(key, it->second, e.what());
      }
    }
    return values;
  }

  template <typename T>
  T get_optional_value(const std::string& key, const T& defaultValue) const {
    std::vector<T> v = get_values<T>(key);
    return v.empty() ? defaultValue : v[0];
  }

  template <typename T>
  T get_value(const std::string& key) const {
    std::vector<T> v = get_values<T>(key);
    if (v.empty()) throw std::runtime_error("failed to get value for key: " + key);
    return v[0];
  }

  void printAll() const;

 protected:
  static const char key_delimiter_ = ':';
  static const char value_delimiter_ = '-';
  static const char comment_delimiter_ = '#';

  std::filesystem::path file_;
  ParamsMultiMap parameters_map_;
  logging::Logger& logger_;
};

}  // namespace cloak::util
