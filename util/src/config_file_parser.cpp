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
#include "config_file_parser.hpp"

#include <fstream>

using std::string;

namespace cloak::util {

void ConfigFileParser::parse() {
  std::ifstream stream(file_, std::ios::binary);
  if (!stream.is_open()) throw std::runtime_error("failed to open file: " + file_.string());

  string key;
  std::uint32_t line_no = 0;
  string line;
  while (std::getline(stream, line)) {
    line_no++;
    trim_inplace(line);
    if (line.empty() || line[0] == comment_delimiter_) continue;

    if (line[0] == value_delimiter_) {  // '- value' belongs to the last bare key
      string value = ltrim(line.substr(1));
      if (key.empty()) throw ParseError(file_, line_no, "not found key for value: " + value);
      LOG_TRACE(logger_, "line:" << line_no << KVLOG(key, value));
      parameters_map_.emplace(key, value);
      continue;
    }

    const size_t keyDelimiterPos = line.find(key_delimiter_);
    if (keyDelimiterPos == string::npos || keyDelimiterPos == 0) {
      throw ParseError(file_, line_no, "unrecognized format: " + line);
    }
    key = rtrim(line.substr(0, keyDelimiterPos));
    string value = ltrim(line.substr(keyDelimiterPos + 1));
    if (!value.empty()) {
      LOG_TRACE(logger_, "line:" << line_no << KVLOG(key, value));
      parameters_map_.emplace(key, value);
      key.clear();
    }
  }
  LOG_DEBUG(logger_, "File: " << file_ << " successfully parsed.");
}

size_t ConfigFileParser::count(const string& key) const { return parameters_map_.count(key); }

void ConfigFileParser::printAll() const {
  for (const auto& it : parameters_map_) {
    LOG_DEBUG(logger_, it.first << ": " << it.second);
  }
}

}  // namespace cloak::util
