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

// Byte-oriented entry points for host bindings. Every fixed-width input is length checked before it is used.

#pragma once

#include <chrono>
#include <memory>
#include <utility>

#include "cloak/Compliance.hpp"
#include "cloak/Config.hpp"
#include "cloak/GuestProgram.hpp"
#include "cloak/Logic.hpp"
#include "cloak/ProverService.hpp"
#include "cloak/Random.hpp"
#include "status.hpp"
#include "types.hpp"

namespace cloak {

class Api {
 public:
  Api(std::shared_ptr<ProverService> prover,
      std::shared_ptr<IGuestProgram> compliance_guest,
      std::shared_ptr<IGuestProgram> logic_guest,
      std::chrono::milliseconds prove_timeout,
      IRandomSource& rng);

  // An attested engine with a fresh key, the compliance guest for config.conservation_policy and the trivial logic
  // guest.
  static std::unique_ptr<Api> create(const Config& config, IRandomSource& rng = systemRandom());

  // Encoded receipt. Throws ProveError, ProveTimeout or ProofEngineFailure.
  Bytes prove(const Bytes& witness, const Bytes& guest_binary);

  // Throws VerifyError for a malformed receipt or an image id that is not 32 bytes.
  bool verify(const Bytes& receipt, const Bytes& expected_image_id);

  // Encoded resource. Throws InvalidInputLength naming the first field that is not 32 bytes.
  Bytes generateResource(const Bytes& label,
                         const Bytes& nonce,
                         const Bytes& quantity,
                         const Bytes& value,
                         bool ephemeral,
                         const Bytes& nsk,
                         const Bytes& image_id,
                         const Bytes& rand_seed);

  // Encoded witness. Throws WitnessAssemblyError.
  Bytes generateComplianceCircuit(const Bytes& consumed,
                                  const Bytes& created,
                                  const Bytes& rcv,
                                  const Bytes& merkle_path,
                                  const Bytes& nsk);

  // Encoded logic witness. Throws WitnessAssemblyError.
  Bytes generateLogicWitness(const Bytes& resource, const Bytes& path, const Bytes& nsk, bool is_consumed);

  Bytes random32();
  Bytes generateMerklePath32();
  Bytes generateNsk();
  Bytes generateNpk(const Bytes& nsk);

  Bytes encrypt(const Bytes& message, const Bytes& pk, const Bytes& sk, const Bytes& nonce);
  util::Status decrypt(const Bytes& cipher, const Bytes& pk, const Bytes& sk, const Bytes& nonce, Bytes& plaintext);

  // (secret key, public key)
  std::pair<Bytes, Bytes> generateKeypair();

  // Throws VerifyError.
  ComplianceInstance getComplianceInstance(const Bytes& receipt);

  const Bytes& complianceGuestBinary() const { return compliance_guest_->binary(); }
  ImageId complianceImageId() const { return compliance_guest_->imageId(); }

  // Throws VerifyError.
  LogicInstance getLogicInstance(const Bytes& receipt);

  const Bytes& logicGuestBinary() const { return logic_guest_->binary(); }
  ImageId logicImageId() const { return logic_guest_->imageId(); }

 private:
  std::shared_ptr<ProverService> prover_;
  std::shared_ptr<IGuestProgram> compliance_guest_;
  std::shared_ptr<IGuestProgram> logic_guest_;
  const std::chrono::milliseconds prove_timeout_;
  IRandomSource& rng_;
};

}  // namespace cloak
