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

#include "cloak/Api.hpp"
#include "cloak/Encryption.hpp"
#include "cloak/Keys.hpp"
#include "cloak/MerklePath.hpp"
#include "cloak/ProofEngine.hpp"
#include "cloak/Resource.hpp"
#include "cloak/errors.hpp"
#include "assertUtils.hpp"
#include "Logger.hpp"
#include "kvstream.h"

namespace cloak {

Api::Api(std::shared_ptr<ProverService> prover,
         std::shared_ptr<IGuestProgram> compliance_guest,
         std::shared_ptr<IGuestProgram> logic_guest,
         std::chrono::milliseconds prove_timeout,
         IRandomSource& rng)
    : prover_{std::move(prover)},
      compliance_guest_{std::move(compliance_guest)},
      logic_guest_{std::move(logic_guest)},
      prove_timeout_{prove_timeout},
      rng_{rng} {
  CloakAssert(prover_ != nullptr);
  CloakAssert(compliance_guest_ != nullptr);
  CloakAssert(logic_guest_ != nullptr);
}

std::unique_ptr<Api> Api::create(const Config& config, IRandomSource& rng) {
  auto registry = std::make_shared<GuestRegistry>();
  auto guest = std::make_shared<ComplianceGuest>(makeConservationPolicy(config.conservation_policy));
  const auto image_id = registry->add(guest);
  auto engine = AttestedProofEngine::create(registry, rng);
  auto prover = std::make_shared<ProverService>(
      engine, config.prover_worker_threads, static_cast<size_t>(config.prover_max_pending));
  auto logic_guest = std::make_shared<TrivialLogicGuest>();
  const auto logic_image_id = registry->add(logic_guest);
  LOG_INFO(CLOAK_LOG,
           "Guests registered: " << KVLOG(image_id, config.conservation_policy, logic_image_id, registry->size()));
  return std::make_unique<Api>(prover, guest, logic_guest, config.prover_timeout, rng);
}

Bytes Api::prove(const Bytes& witness, const Bytes& guest_binary) {
  return prover_->proveWithTimeout(witness, guest_binary, prove_timeout_).encode();
}

bool Api::verify(const Bytes& receipt, const Bytes& expected_image_id) {
  if (expected_image_id.size() != Bytes32::ByteSize) {
    throw VerifyError("image id must be 32 bytes, got " + std::to_string(expected_image_id.size()));
  }
  return prover_->engine().verify(Receipt::decode(receipt),
                                  Bytes32::fromBuffer(expected_image_id, "expected_image_id"));
}

Bytes Api::generateResource(const Bytes& label,
                            const Bytes& nonce,
                            const Bytes& quantity,
                            const Bytes& value,
                            bool ephemeral,
                            const Bytes& nsk,
                            const Bytes& image_id,
                            const Bytes& rand_seed) {
  return cloak::generateResource(Bytes32::fromBuffer(label, "label"),
                                 Bytes32::fromBuffer(nonce, "nonce"),
                                 Bytes32::fromBuffer(quantity, "quantity"),
                                 Bytes32::fromBuffer(value, "value"),
                                 ephemeral,
                                 Bytes32::fromBuffer(nsk, "nsk"),
                                 Bytes32::fromBuffer(image_id, "image_id"),
                                 Bytes32::fromBuffer(rand_seed, "rand_seed"))
      .encode();
}

Bytes Api::generateComplianceCircuit(const Bytes& consumed,
                                     const Bytes& created,
                                     const Bytes& rcv,
                                     const Bytes& merkle_path,
                                     const Bytes& nsk) {
  return cloak::generateComplianceCircuit(consumed, created, rcv, merkle_path, nsk);
}

Bytes Api::generateLogicWitness(const Bytes& resource, const Bytes& path, const Bytes& nsk, bool is_consumed) {
  return cloak::generateLogicWitness(resource, path, nsk, is_consumed);
}

Bytes Api::random32() { return rng_.random32().toBytes(); }

Bytes Api::generateMerklePath32() { return cloak::generateMerklePath32().encode(); }

Bytes Api::generateNsk() { return cloak::generateNsk(rng_).toBytes(); }

Bytes Api::generateNpk(const Bytes& nsk) { return commitNullifierKey(Bytes32::fromBuffer(nsk, "nsk")).toBytes(); }

Bytes Api::encrypt(const Bytes& message, const Bytes& pk, const Bytes& sk, const Bytes& nonce) {
  return cloak::encrypt(message, pk, sk, nonce);
}

util::Status Api::decrypt(const Bytes& cipher, const Bytes& pk, const Bytes& sk, const Bytes& nonce, Bytes& plaintext) {
  return cloak::decrypt(cipher, pk, sk, nonce, plaintext);
}

std::pair<Bytes, Bytes> Api::generateKeypair() {
  auto kp = generateKeyPair(rng_);
  return {kp.secret_key.toBytes(), kp.public_key.toBytes()};
}

ComplianceInstance Api::getComplianceInstance(const Bytes& receipt) {
  return decodeComplianceInstance(Receipt::decode(receipt));
}

LogicInstance Api::getLogicInstance(const Bytes& receipt) { return decodeLogicInstance(Receipt::decode(receipt)); }

}  // namespace cloak
