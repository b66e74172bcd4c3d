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

#include "cloak/ProofEngine.hpp"
#include "cloak/errors.hpp"
#include "assertUtils.hpp"
#include "Logger.hpp"
#include "kvstream.h"
#include "sha_hash.hpp"

#include <chrono>

namespace cloak {

using crypto::openssl::EdDSAPrivateKey;
using crypto::openssl::EdDSAPublicKey;

namespace {
const std::string kReceiptClaimDomain = "cloak.receipt.claim";
}

Bytes32 AttestedVerifier::claimDigest(const ImageId& image_id, const Bytes& journal) {
  return Bytes32{util::sha256Of(kReceiptClaimDomain, image_id, util::sha256Of(journal))};
}

bool AttestedVerifier::verify(const Receipt& receipt, const ImageId& expected_image_id) const {
  SCOPED_MDC_OP("verify");
  if (receipt.seal.size() != kSealSize) {
    throw VerifyError("seal must be " + std::to_string(kSealSize) + " bytes, got " +
                      std::to_string(receipt.seal.size()));
  }
  const auto image_id = Bytes32::fromBuffer(receipt.seal.data(), Bytes32::ByteSize, "seal image id");
  if (image_id != expected_image_id) {
    LOG_INFO(PROVER_LOG, "Receipt is for another image: " << KVLOG(image_id, expected_image_id));
    return false;
  }
  const auto claim = claimDigest(image_id, receipt.journal);
  const bool ok = verifier_.verifyBuffer(claim.data(),
                                         claim.size(),
                                         receipt.seal.data() + Bytes32::ByteSize,
                                         receipt.seal.size() - Bytes32::ByteSize);
  if (!ok) LOG_INFO(PROVER_LOG, "Seal does not verify: " << KVLOG(image_id, claim));
  return ok;
}

AttestedProofEngine::AttestedProofEngine(std::shared_ptr<GuestRegistry> registry, const EdDSAPrivateKey& key)
    : registry_{std::move(registry)}, signer_{key}, verifier_{crypto::openssl::deriveEdDSAPublicKey(key)} {
  CloakAssert(registry_ != nullptr);
}

std::shared_ptr<AttestedProofEngine> AttestedProofEngine::create(std::shared_ptr<GuestRegistry> registry,
                                                                 IRandomSource& rng) {
  EdDSAPrivateKey::ByteArray key;
  rng.fill(key.data(), key.size());
  return std::make_shared<AttestedProofEngine>(std::move(registry), EdDSAPrivateKey{key});
}

Receipt AttestedProofEngine::prove(const Bytes& input, const Bytes& guest_binary) {
  const ImageId image_id{util::sha256Of(guest_binary)};
  SCOPED_MDC_OP("prove");
  SCOPED_MDC_IMAGE_ID(image_id.toHexString().substr(0, 16));

  auto program = registry_->find(image_id);
  if (!program) {
    LOG_ERROR(PROVER_LOG, "Unknown guest program: " << KVLOG(image_id, guest_binary.size()));
    throw ProofEngineFailure("no guest program registered with image id " + image_id.toHexString());
  }

  const auto start = std::chrono::steady_clock::now();
  Receipt receipt;
  try {
    receipt.journal = program->execute(input);
  } catch (const GuestAbort& e) {
    LOG_WARN(PROVER_LOG, "Guest aborted: " << KVLOG(program->name(), e.what()));
    throw ProveError(e.what());
  } catch (const crypto::openssl::OpenSSLError& e) {
    LOG_ERROR(PROVER_LOG, "Backend failure: " << KVLOG(program->name(), e.what()));
    throw ProofEngineFailure(std::string{"backend failure: "} + e.what());
  }

  const auto claim = AttestedVerifier::claimDigest(image_id, receipt.journal);
  receipt.seal.resize(AttestedVerifier::kSealSize);
  std::copy(image_id.getBytes().begin(), image_id.getBytes().end(), receipt.seal.begin());
  signer_.signBuffer(claim.data(), claim.size(), receipt.seal.data() + Bytes32::ByteSize);

  const auto elapsed_us =
      std::chrono::duration_cast<std::chrono::microseconds>(std::chrono::steady_clock::now() - start).count();
  LOG_INFO(PROVER_LOG, "Receipt sealed: " << KVLOG(program->name(), receipt.journal.size(), elapsed_us));
  return receipt;
}

ComplianceInstance decodeComplianceInstance(const Receipt& receipt) {
  try {
    return ComplianceInstance::decode(receipt.journal);
  } catch (const InputValidationError& e) {
    throw VerifyError(std::string{"journal is not a compliance instance: "} + e.what());
  }
}

LogicInstance decodeLogicInstance(const Receipt& receipt) {
  try {
    return LogicInstance::decode(receipt.journal);
  } catch (const InputValidationError& e) {
    throw VerifyError(std::string{"journal is not a logic instance: "} + e.what());
  }
}

}  // namespace cloak
