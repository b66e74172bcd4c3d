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

// The compliance unit: one consumed resource, one created resource, and what the compliance guest publishes about
// them.

#pragma once

#include <ostream>

#include "cloak/Bytes32.hpp"
#include "cloak/MerklePath.hpp"
#include "cloak/Resource.hpp"
#include "cloak/ValueCommitment.hpp"
#include "types.hpp"

namespace cloak {

// Private input of the compliance guest. Its encoding is the program input handed to the proof engine.
struct ComplianceWitness {
  Resource consumed;
  Resource created;
  Bytes32 rcv;
  MerklePath merkle_path;
  NullifierKey nsk;

  Bytes encode() const;
  // Throws MalformedEncoding.
  static ComplianceWitness decode(const Bytes& bytes);
};

// Public output of the compliance guest, committed to the receipt journal.
struct ComplianceInstance {
  Nullifier nullifier;
  Commitment created_commitment;
  ImageId consumed_image_id;
  ImageId created_image_id;
  Bytes32 merkle_root;
  ValueCommitment delta;

  Bytes encode() const;
  // Throws InvalidInputLength / MalformedEncoding.
  static ComplianceInstance decode(const Bytes& bytes);

  bool operator==(const ComplianceInstance& other) const;
  bool operator!=(const ComplianceInstance& other) const { return !(*this == other); }
};

std::ostream& operator<<(std::ostream& os, const ComplianceInstance& instance);

// Throws WitnessAssemblyError unless rcv is a scalar in (0, n) and both quantities are below n.
ComplianceWitness makeComplianceWitness(const Resource& consumed,
                                        const Resource& created,
                                        const Bytes32& rcv,
                                        const MerklePath& merkle_path,
                                        const NullifierKey& nsk);

// Byte level witness assembly: decodes every input and returns the encoded witness. Any malformed or wrong-length
// input is reported as WitnessAssemblyError.
Bytes generateComplianceCircuit(const Bytes& consumed,
                                const Bytes& created,
                                const Bytes& rcv,
                                const Bytes& merkle_path,
                                const Bytes& nsk);

}  // namespace cloak
