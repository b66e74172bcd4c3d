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

#include "cloak/Config.hpp"
#include "cloak/ConservationPolicy.hpp"
#include "cloak/errors.hpp"
#include "config_file_parser.hpp"
#include "Logger.hpp"
#include "kvstream.h"

namespace cloak {

Config Config::load(const std::string& path) {
  util::ConfigFileParser parser(CLOAK_LOG, path);
  Config config;
  try {
    parser.parse();
    config.prover_worker_threads =
        parser.get_optional_value<std::uint32_t>("prover.worker_threads", config.prover_worker_threads);
    config.prover_timeout = std::chrono::milliseconds{parser.get_optional_value<std::uint64_t>(
        "prover.timeout_ms", static_cast<std::uint64_t>(config.prover_timeout.count()))};
    config.prover_max_pending =
        parser.get_optional_value<std::uint64_t>("prover.max_pending", config.prover_max_pending);
    config.conservation_policy =
        parser.get_optional_value<std::string>("compliance.conservation_policy", config.conservation_policy);
    config.logging_config_file =
        parser.get_optional_value<std::string>("logging.config_file", config.logging_config_file);
  } catch (const std::runtime_error& e) {
    // Unreadable file, ParseError or ValueError.
    throw ConfigError(e.what());
  }

  if (config.prover_worker_threads == 0) throw ConfigError("prover.worker_threads must be positive");
  if (config.prover_max_pending == 0) throw ConfigError("prover.max_pending must be positive");
  if (config.prover_timeout.count() <= 0) throw ConfigError("prover.timeout_ms must be positive");
  // Rejects unknown names.
  makeConservationPolicy(config.conservation_policy);

  LOG_INFO(CLOAK_LOG, "Configuration loaded: " << KVLOG(path) << config);
  return config;
}

std::ostream& operator<<(std::ostream& os, const Config& config) {
  os << KVLOG(config.prover_worker_threads,
              config.prover_timeout.count(),
              config.prover_max_pending,
              config.conservation_policy,
              config.logging_config_file);
  return os;
}

}  // namespace cloak
