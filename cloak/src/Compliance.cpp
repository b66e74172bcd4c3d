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

#include "cloak/Compliance.hpp"
#include "cloak/errors.hpp"
#include "Logger.hpp"
#include "kvstream.h"
#include "wire.hpp"

namespace cloak {

static constexpr size_t kInstanceEncodedSize = 5 * Bytes32::ByteSize + ValueCommitment::ByteSize;

Bytes ComplianceWitness::encode() const {
  Bytes out;
  serialize(out, consumed);
  serialize(out, created);
  serialize(out, rcv);
  serialize(out, merkle_path);
  serialize(out, nsk);
  return out;
}

ComplianceWitness ComplianceWitness::decode(const Bytes& bytes) {
  const uint8_t* start = bytes.data();
  const uint8_t* end = bytes.data() + bytes.size();
  try {
    auto consumed = deserializeResource(start, end);
    auto created = deserializeResource(start, end);
    Bytes32 rcv;
    deserialize(start, end, rcv);
    auto path = deserializeMerklePath(start, end);
    NullifierKey nsk;
    deserialize(start, end, nsk);
    wire::expectEnd(start, end);
    return ComplianceWitness{consumed, created, rcv, path, nsk};
  } catch (const wire::DeserializeError& e) {
    throw MalformedEncoding("compliance witness", e.what());
  }
}

Bytes ComplianceInstance::encode() const {
  Bytes out;
  out.reserve(kInstanceEncodedSize);
  serialize(out, nullifier);
  serialize(out, created_commitment);
  serialize(out, consumed_image_id);
  serialize(out, created_image_id);
  serialize(out, merkle_root);
  serialize(out, delta);
  return out;
}

ComplianceInstance ComplianceInstance::decode(const Bytes& bytes) {
  if (bytes.size() != kInstanceEncodedSize) {
    throw InvalidInputLength("compliance instance", kInstanceEncodedSize, bytes.size());
  }
  const uint8_t* start = bytes.data();
  const uint8_t* end = bytes.data() + bytes.size();
  ComplianceInstance instance;
  try {
    deserialize(start, end, instance.nullifier);
    deserialize(start, end, instance.created_commitment);
    deserialize(start, end, instance.consumed_image_id);
    deserialize(start, end, instance.created_image_id);
    deserialize(start, end, instance.merkle_root);
    deserialize(start, end, instance.delta);
    wire::expectEnd(start, end);
  } catch (const wire::DeserializeError& e) {
    throw MalformedEncoding("compliance instance", e.what());
  }
  return instance;
}

bool ComplianceInstance::operator==(const ComplianceInstance& other) const {
  return nullifier == other.nullifier && created_commitment == other.created_commitment &&
         consumed_image_id == other.consumed_image_id && created_image_id == other.created_image_id &&
         merkle_root == other.merkle_root && delta == other.delta;
}

std::ostream& operator<<(std::ostream& os, const ComplianceInstance& instance) {
  os << KVLOG(instance.nullifier,
              instance.created_commitment,
              instance.consumed_image_id,
              instance.created_image_id,
              instance.merkle_root,
              instance.delta);
  return os;
}

ComplianceWitness makeComplianceWitness(const Resource& consumed,
                                        const Resource& created,
                                        const Bytes32& rcv,
                                        const MerklePath& merkle_path,
                                        const NullifierKey& nsk) {
  if (!isCanonicalScalar(rcv)) throw WitnessAssemblyError("rcv is not a scalar in (0, n)");
  if (!isValidQuantity(consumed.quantity())) throw WitnessAssemblyError("consumed quantity is not below n");
  if (!isValidQuantity(created.quantity())) throw WitnessAssemblyError("created quantity is not below n");
  return ComplianceWitness{consumed, created, rcv, merkle_path, nsk};
}

Bytes generateComplianceCircuit(const Bytes& consumed,
                                const Bytes& created,
                                const Bytes& rcv,
                                const Bytes& merkle_path,
                                const Bytes& nsk) {
  try {
    auto witness = makeComplianceWitness(Resource::decode(consumed),
                                         Resource::decode(created),
                                         Bytes32::fromBuffer(rcv, "rcv"),
                                         MerklePath::decode(merkle_path),
                                         Bytes32::fromBuffer(nsk, "nsk"));
    LOG_DEBUG(COMPLIANCE_LOG,
              "Witness assembled: " << KVLOG(witness.consumed.commitment(), witness.created.commitment()));
    return witness.encode();
  } catch (const WitnessAssemblyError&) {
    throw;
  } catch (const InputValidationError& e) {
    throw WitnessAssemblyError(e.what());
  }
}

}  // namespace cloak
