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

#include <ostream>

#include "cloak/Bytes32.hpp"
#include "types.hpp"

namespace cloak {

/**
 * A shielded resource. Values are immutable; a transfer consumes one resource and creates another.
 *
 * image_id    identity of the resource logic the resource is valid under
 * label       resource kind within that logic
 * quantity    amount, read as a big-endian integer
 * value       application data
 * ephemeral   the resource only lives within one transaction
 * nonce       makes commitments of otherwise equal resources distinct
 * npk         commitment to the owner's nullifier key
 * rand_seed   seed for the commitment and nullifier randomness
 */
class Resource {
 public:
  // Size of the wire encoding: seven 32-byte fields and the ephemeral flag.
  static constexpr size_t kEncodedSize = 7 * Bytes32::ByteSize + 1;

  Resource(const ImageId& image_id,
           const Bytes32& label,
           const Bytes32& quantity,
           const Bytes32& value,
           bool ephemeral,
           const Bytes32& nonce,
           const NullifierKeyCommitment& npk,
           const Bytes32& rand_seed);

  const ImageId& imageId() const { return image_id_; }
  const Bytes32& label() const { return label_; }
  const Bytes32& quantity() const { return quantity_; }
  const Bytes32& value() const { return value_; }
  bool isEphemeral() const { return ephemeral_; }
  const Bytes32& nonce() const { return nonce_; }
  const NullifierKeyCommitment& npk() const { return npk_; }
  const Bytes32& randSeed() const { return rand_seed_; }

  // cm = SHA-256("cloak.resource.commitment" || image_id || label || value || npk || nonce || quantity ||
  //              ephemeral || rcm), with rcm = SHA-256(rand_seed || "rcm" || nonce).
  Commitment commitment() const;

  // nf = SHA-256("cloak.resource.nullifier" || nsk || nonce || psi || cm), with
  // psi = SHA-256(rand_seed || "psi" || nonce). Throws NullifierKeyMismatch unless nsk opens npk.
  Nullifier nullifier(const NullifierKey& nsk) const;

  // Same as nullifier() for a caller that already holds the commitment.
  Nullifier nullifierFromCommitment(const NullifierKey& nsk, const Commitment& cm) const;

  Bytes encode() const;
  // Throws InvalidInputLength for a buffer of the wrong size and MalformedEncoding for a bad ephemeral flag.
  static Resource decode(const Bytes& bytes);

  bool operator==(const Resource& other) const;
  bool operator!=(const Resource& other) const { return !(*this == other); }

 private:
  Bytes32 commitmentRandomness() const;
  Bytes32 nullifierRandomness() const;

  ImageId image_id_;
  Bytes32 label_;
  Bytes32 quantity_;
  Bytes32 value_;
  bool ephemeral_;
  Bytes32 nonce_;
  NullifierKeyCommitment npk_;
  Bytes32 rand_seed_;
};

// Builds a resource owned by the holder of nsk.
Resource generateResource(const Bytes32& label,
                          const Bytes32& nonce,
                          const Bytes32& quantity,
                          const Bytes32& value,
                          bool ephemeral,
                          const NullifierKey& nsk,
                          const ImageId& image_id,
                          const Bytes32& rand_seed);

void serialize(Bytes& output, const Resource& r);
Resource deserializeResource(const uint8_t*& start, const uint8_t* end);

std::ostream& operator<<(std::ostream& os, const Resource& r);

}  // namespace cloak
