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

#include "cloak/GuestProgram.hpp"
#include "cloak/Compliance.hpp"
#include "cloak/Logic.hpp"
#include "cloak/ValueCommitment.hpp"
#include "cloak/errors.hpp"
#include "assertUtils.hpp"
#include "Logger.hpp"
#include "kvstream.h"
#include "sha_hash.hpp"

namespace cloak {

namespace {
const std::string kComplianceGuestName = "cloak.guest.compliance";
const std::string kComplianceGuestVersion = "1";
const std::string kTrivialLogicGuestName = "cloak.guest.trivial-logic";
const std::string kTrivialLogicGuestVersion = "1";
}  // namespace

ImageId IGuestProgram::imageId() const { return Bytes32{util::sha256Of(binary())}; }

ComplianceGuest::ComplianceGuest(std::shared_ptr<IConservationPolicy> policy)
    : policy_{std::move(policy)}, name_{kComplianceGuestName} {
  CloakAssert(policy_ != nullptr);
  const std::string image = kComplianceGuestName + "/v" + kComplianceGuestVersion + ";policy=" + policy_->name();
  binary_.assign(image.begin(), image.end());
}

Bytes ComplianceGuest::execute(const Bytes& input) const {
  ComplianceWitness witness = [&]() {
    try {
      return ComplianceWitness::decode(input);
    } catch (const InputValidationError& e) {
      throw GuestAbort(std::string{"cannot decode witness: "} + e.what());
    }
  }();
  const auto& consumed = witness.consumed;
  const auto& created = witness.created;

  ComplianceInstance instance;
  const Commitment cm_in = consumed.commitment();

  instance.merkle_root = witness.merkle_path.root(cm_in);
  if (witness.merkle_path.anchor() && *witness.merkle_path.anchor() != instance.merkle_root) {
    LOG_WARN(COMPLIANCE_LOG,
             "Consumed commitment is not under the anchor: " << KVLOG(cm_in, instance.merkle_root)
                                                             << KVLOG(*witness.merkle_path.anchor()));
    throw GuestAbort("merkle path does not lead to its anchor");
  }

  try {
    instance.nullifier = consumed.nullifierFromCommitment(witness.nsk, cm_in);
  } catch (const NullifierKeyMismatch& e) {
    throw GuestAbort(e.what());
  }

  if (!isCanonicalScalar(witness.rcv)) throw GuestAbort("rcv is not a scalar in (0, n)");
  if (!isValidQuantity(consumed.quantity()) || !isValidQuantity(created.quantity())) {
    throw GuestAbort("quantity is not below the group order");
  }
  instance.created_commitment = created.commitment();
  instance.consumed_image_id = consumed.imageId();
  instance.created_image_id = created.imageId();
  instance.delta = computeDelta(consumed, created, witness.rcv);

  if (auto violation = policy_->check(consumed, created)) {
    LOG_WARN(COMPLIANCE_LOG, "Conservation violated: " << KVLOG(policy_->name(), *violation));
    throw GuestAbort(policy_->name() + ": " + *violation);
  }

  LOG_DEBUG(COMPLIANCE_LOG, instance);
  return instance.encode();
}

TrivialLogicGuest::TrivialLogicGuest() : name_{kTrivialLogicGuestName} {
  const std::string image = kTrivialLogicGuestName + "/v" + kTrivialLogicGuestVersion;
  binary_.assign(image.begin(), image.end());
}

Bytes TrivialLogicGuest::execute(const Bytes& input) const {
  LogicWitness witness = [&]() {
    try {
      return LogicWitness::decode(input);
    } catch (const InputValidationError& e) {
      throw GuestAbort(std::string{"cannot decode logic witness: "} + e.what());
    }
  }();
  const auto& resource = witness.resource;

  if (!resource.isEphemeral()) throw GuestAbort("resource is not ephemeral");
  if (!resource.quantity().isZero()) throw GuestAbort("resource quantity is not zero");

  LogicInstance instance;
  instance.is_consumed = witness.is_consumed;
  const Commitment cm = resource.commitment();
  if (witness.is_consumed) {
    try {
      instance.tag = resource.nullifierFromCommitment(witness.nsk, cm);
    } catch (const NullifierKeyMismatch& e) {
      throw GuestAbort(e.what());
    }
  } else {
    instance.tag = cm;
  }

  instance.root = witness.path.root(instance.tag);
  if (witness.path.anchor() && *witness.path.anchor() != instance.root) {
    LOG_WARN(LOGIC_LOG, "Tag is not under the anchor: " << KVLOG(instance.tag, instance.root));
    throw GuestAbort("merkle path does not lead to its anchor");
  }

  LOG_DEBUG(LOGIC_LOG, instance);
  return instance.encode();
}

ImageId GuestRegistry::add(std::shared_ptr<IGuestProgram> program) {
  CloakAssert(program != nullptr);
  auto image_id = program->imageId();
  std::lock_guard<std::mutex> g(lock_);
  programs_.insert_or_assign(image_id, std::move(program));
  return image_id;
}

std::shared_ptr<IGuestProgram> GuestRegistry::find(const ImageId& image_id) const {
  std::lock_guard<std::mutex> g(lock_);
  auto it = programs_.find(image_id);
  return it == programs_.end() ? nullptr : it->second;
}

size_t GuestRegistry::size() const {
  std::lock_guard<std::mutex> g(lock_);
  return programs_.size();
}

}  // namespace cloak
