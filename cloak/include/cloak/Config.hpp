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

// Runtime settings, read from a "key: value" file:
//
//   prover.worker_threads: 2
//   prover.timeout_ms: 60000
//   prover.max_pending: 64
//   compliance.conservation_policy: strict-quantity
//   logging.config_file: /etc/cloak/log.properties
//
// Missing keys keep their defaults.

#pragma once

#include <chrono>
#include <cstdint>
#include <ostream>
#include <string>

namespace cloak {

struct Config {
  std::uint32_t prover_worker_threads = 2;
  std::chrono::milliseconds prover_timeout{60000};
  std::uint64_t prover_max_pending = 64;
  std::string conservation_policy = "strict-quantity";
  // Empty: keep the built-in logging defaults.
  std::string logging_config_file;

  // Throws ConfigError if the file cannot be read, a value does not parse or is out of range, or the conservation
  // policy is unknown.
  static Config load(const std::string& path);
};

std::ostream& operator<<(std::ostream& os, const Config& config);

}  // namespace cloak
