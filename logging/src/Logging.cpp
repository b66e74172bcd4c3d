// Cloak
//
// Copyright (c) 2024 VMware, Inc. All Rights Reserved.
//
// This product is licensed to you under the Apache 2.0 license (the "License").
// You may not use this product except in compliance with the Apache 2.0 License.
//
// This product may include a number of subcomponents with separate copyright
// notices and license terms. Your use of these subcomponents is subject to the
// terms and conditions of the subcomponent's license,
// as noted in the LICENSE file.

#include "Logger.hpp"
#include "string.hpp"

#include <fstream>
#include <iostream>
#include <map>
#include <mutex>
#include <optional>

namespace logging {

std::array<std::string, 6> LoggerImpl::LEVELS_STRINGS = {"TRACE", "DEBUG", "INFO ", "WARN ", "ERROR", "FATAL"};

namespace {

std::optional<LogLevel> parseLevel(const std::string& levelStr) {
  static const std::map<std::string, LogLevel> levels = {{"TRACE", LogLevel::trace},
                                                         {"DEBUG", LogLevel::debug},
                                                         {"INFO", LogLevel::info},
                                                         {"WARN", LogLevel::warn},
                                                         {"ERROR", LogLevel::error},
                                                         {"FATAL", LogLevel::fatal}};
  auto it = levels.find(levelStr);
  if (it == levels.end()) return std::nullopt;
  return it->second;
}

}  // namespace

/**
 * Loggers are created once and never destroyed, so handles returned from here stay valid for the process lifetime.
 */
Logger getLogger(const std::string& name) {
  static std::map<std::string, LoggerImpl> logmap_;
  static std::mutex mux;
  std::lock_guard g(mux);
  return logmap_.try_emplace(name, name).first->second;
}

void initLogger(const std::string& configFileName) {
  if (!Logger::config(configFileName)) {
    std::cout << "using default configuration" << std::endl;
  }
}

/**
 * Configuration lines have the form
 *   log.<logger name>:<LEVEL>
 * Lines starting with '#' and lines for other components are skipped.
 */
bool Logger::config(const std::string& configFileName) {
  std::ifstream infile(configFileName);
  if (!infile.is_open()) {
    std::cerr << __PRETTY_FUNCTION__ << ": can't open " << configFileName << std::endl;
    return false;
  }
  std::string line;
  while (std::getline(infile, line)) {
    cloak::util::trim_inplace(line);
    if (line.empty() || line[0] == '#') continue;
    if (line.compare(0, 4, "log.")) continue;
    line.erase(0, 4);
    if (size_t pos = line.find(':'); pos != line.npos) {
      std::string logger = cloak::util::rtrim(line.substr(0, pos));
      std::string levelStr = cloak::util::ltrim(line.substr(pos + 1));
      auto level = parseLevel(levelStr);
      if (!level) {
        std::cerr << __PRETTY_FUNCTION__ << ": ignoring invalid log level " << levelStr << std::endl;
        continue;
      }
      std::cout << __PRETTY_FUNCTION__ << ": " << logger << " -> " << levelStr << std::endl;
      getLogger(logger).setLogLevel(*level);
    }
  }
  return true;
}

}  // namespace logging
