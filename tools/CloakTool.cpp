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

// Command line front end:
//
//   cloak-tool image-id [--config FILE]    prints the image ids of the compliance guest for the configured policy
//                                          and of the trivial logic guest
//   cloak-tool keygen                      prints a fresh hex encoded Ed25519 attestation key pair
//   cloak-tool demo [--config FILE]        proves and verifies one transfer against an in-memory commitment tree

#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>

#include <boost/program_options.hpp>

#include "cloak/Api.hpp"
#include "cloak/CommitmentTree.hpp"
#include "cloak/Config.hpp"
#include "cloak/ConservationPolicy.hpp"
#include "cloak/GuestProgram.hpp"
#include "cloak/Resource.hpp"
#include "cloak/ValueCommitment.hpp"
#include "cloak/errors.hpp"
#include "crypto/crypto.hpp"
#include "hex_tools.h"
#include "Logger.hpp"
#include "kvstream.h"

namespace po = boost::program_options;

using cloak::Api;
using cloak::Bytes;
using cloak::Config;

po::variables_map parseCmdLine(int argc, char** argv) {
  po::options_description desc("cloak-tool options");
  // clang-format off
  desc.add_options()
    ("help,h", "Print this message")
    ("command", po::value<std::string>()->required(), "One of image-id, keygen, demo")
    ("config", po::value<std::string>(), "Configuration file (key: value lines)")
    ("policy", po::value<std::string>(), "Conservation policy, overrides the configuration file")
    ("quantity", po::value<uint64_t>()->default_value(100), "Quantity moved by the demo transfer")
  ;
  // clang-format on
  po::positional_options_description positional;
  positional.add("command", 1);

  po::variables_map opts;
  po::store(po::command_line_parser(argc, argv).options(desc).positional(positional).run(), opts);
  if (opts.count("help")) {
    std::cout << desc << std::endl;
    std::exit(0);
  }
  po::notify(opts);
  return opts;
}

Config loadConfig(const po::variables_map& opts) {
  Config config = opts.count("config") ? Config::load(opts["config"].as<std::string>()) : Config{};
  if (opts.count("policy")) {
    config.conservation_policy = opts["policy"].as<std::string>();
    cloak::makeConservationPolicy(config.conservation_policy);
  }
  return config;
}

Bytes quantityBytes(uint64_t q) {
  Bytes out(32, 0);
  for (int i = 0; i < 8; i++) out[31 - i] = static_cast<uint8_t>(q >> (8 * i));
  return out;
}

// One compliant transfer through the byte level API.
int runDemo(Api& api, uint64_t quantity, logging::Logger& logger) {
  const auto label = api.random32();
  const auto logic = api.random32();
  const auto sender_nsk = api.generateNsk();
  const auto receiver_nsk = api.generateNsk();

  const auto consumed = api.generateResource(
      label, api.random32(), quantityBytes(quantity), api.random32(), false, sender_nsk, logic, api.random32());
  const auto created = api.generateResource(
      label, api.random32(), quantityBytes(quantity), api.random32(), false, receiver_nsk, logic, api.random32());

  cloak::CommitmentTree tree;
  const auto leaf = tree.insert(cloak::Resource::decode(consumed).commitment());
  const auto path = tree.pathFor(leaf).encode();

  Bytes rcv;
  do {
    rcv = api.random32();
  } while (!cloak::isCanonicalScalar(cloak::Bytes32::fromBuffer(rcv, "rcv")));

  const auto witness = api.generateComplianceCircuit(consumed, created, rcv, path, sender_nsk);
  const auto receipt = api.prove(witness, api.complianceGuestBinary());
  const bool valid = api.verify(receipt, api.complianceImageId().toBytes());
  const auto instance = api.getComplianceInstance(receipt);

  LOG_INFO(logger, "Demo transfer proven: " << KVLOG(valid, receipt.size()));
  std::cout << "image id:           " << api.complianceImageId() << std::endl
            << "nullifier:          " << instance.nullifier << std::endl
            << "created commitment: " << instance.created_commitment << std::endl
            << "merkle root:        " << instance.merkle_root << std::endl
            << "delta:              " << instance.delta << std::endl
            << "receipt verifies:   " << (valid ? "yes" : "no") << std::endl;
  return valid ? 0 : 1;
}

int main(int argc, char** argv) {
  auto logger = logging::getLogger("cloak.tool");
  po::variables_map opts;
  try {
    opts = parseCmdLine(argc, argv);
  } catch (const po::error& e) {
    std::cerr << "Failed to parse command line arguments: " << e.what() << std::endl;
    return 1;
  }

  Config config;
  try {
    config = loadConfig(opts);
  } catch (const cloak::ConfigError& e) {
    LOG_ERROR(logger, e.what());
    return 1;
  }
  if (!config.logging_config_file.empty()) logging::initLogger(config.logging_config_file);

  const auto command = opts["command"].as<std::string>();
  try {
    if (command == "keygen") {
      const auto [priv, pub] = cloak::crypto::generateEdDSAKeyPair();
      std::cout << "private: " << priv << std::endl << "public:  " << pub << std::endl;
      return 0;
    }
    if (command == "image-id") {
      cloak::ComplianceGuest guest{cloak::makeConservationPolicy(config.conservation_policy)};
      cloak::TrivialLogicGuest logic_guest;
      std::cout << "compliance: " << guest.imageId() << std::endl << "logic:      " << logic_guest.imageId() << std::endl;
      return 0;
    }
    if (command == "demo") {
      auto api = Api::create(config);
      return runDemo(*api, opts["quantity"].as<uint64_t>(), logger);
    }
  } catch (const cloak::CloakError& e) {
    LOG_ERROR(logger, KVLOG(command, e.what()));
    return 1;
  } catch (const std::exception& e) {
    LOG_FATAL(logger, KVLOG(command, e.what()));
    return 1;
  }
  std::cerr << "Unknown command: " << command << std::endl;
  return 1;
}
