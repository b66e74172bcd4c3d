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

#include <memory>

#include "cloak/Bytes32.hpp"
#include "cloak/Compliance.hpp"
#include "cloak/GuestProgram.hpp"
#include "cloak/Logic.hpp"
#include "cloak/Random.hpp"
#include "cloak/Receipt.hpp"
#include "crypto/openssl/EdDSA.hpp"
#include "crypto/openssl/EdDSASigner.hpp"
#include "crypto/openssl/EdDSAVerifier.hpp"

namespace cloak {

class IReceiptVerifier {
 public:
  virtual ~IReceiptVerifier() = default;

  // False for a well formed receipt that does not attest a run of expected_image_id: a wrong key, another image or
  // a tampered journal. Throws VerifyError only if the receipt itself is malformed.
  virtual bool verify(const Receipt& receipt, const ImageId& expected_image_id) const = 0;
};

// Proving oracle. Implementations must be safe to call from several threads at once.
class IProofEngine : public IReceiptVerifier {
 public:
  // Runs the guest identified by guest_binary on input and seals its journal. Throws ProveError if the guest
  // rejects the input and ProofEngineFailure if the guest is unknown or the backend fails.
  virtual Receipt prove(const Bytes& input, const Bytes& guest_binary) = 0;
};

/**
 * Receipts of the attested backend carry seal = image_id || Ed25519(SHA-256("cloak.receipt.claim" || image_id ||
 * SHA-256(journal))). Checking one needs the engine's public key only.
 */
class AttestedVerifier : public IReceiptVerifier {
 public:
  static constexpr size_t kSealSize = Bytes32::ByteSize + crypto::Ed25519SignatureByteSize;

  explicit AttestedVerifier(const crypto::openssl::EdDSAPublicKey& public_key) : verifier_{public_key} {}

  bool verify(const Receipt& receipt, const ImageId& expected_image_id) const override;

  const crypto::openssl::EdDSAPublicKey& publicKey() const { return verifier_.publicKey_; }

  // The message the seal signs.
  static Bytes32 claimDigest(const ImageId& image_id, const Bytes& journal);

 private:
  crypto::openssl::EdDSAVerifier<crypto::openssl::EdDSAPublicKey> verifier_;
};

// Runs registered native guest programs and attests their journals with an Ed25519 key.
class AttestedProofEngine : public IProofEngine {
 public:
  AttestedProofEngine(std::shared_ptr<GuestRegistry> registry, const crypto::openssl::EdDSAPrivateKey& key);

  // Engine with a fresh attestation key drawn from rng.
  static std::shared_ptr<AttestedProofEngine> create(std::shared_ptr<GuestRegistry> registry, IRandomSource& rng);

  Receipt prove(const Bytes& input, const Bytes& guest_binary) override;
  bool verify(const Receipt& receipt, const ImageId& expected_image_id) const override {
    return verifier_.verify(receipt, expected_image_id);
  }

  const AttestedVerifier& verifier() const { return verifier_; }
  GuestRegistry& registry() { return *registry_; }

 private:
  std::shared_ptr<GuestRegistry> registry_;
  crypto::openssl::EdDSASigner<crypto::openssl::EdDSAPrivateKey> signer_;
  AttestedVerifier verifier_;
};

// Public fields of a compliance receipt. Throws VerifyError if the journal is not a compliance instance.
ComplianceInstance decodeComplianceInstance(const Receipt& receipt);

// Public fields of a logic receipt. Throws VerifyError if the journal is not a logic instance.
LogicInstance decodeLogicInstance(const Receipt& receipt);

}  // namespace cloak
