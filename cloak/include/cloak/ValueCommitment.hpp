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

// Pedersen-style value commitments over secp256k1.
//
// Every resource kind (image_id, label) has its own generator K, found by hashing to the curve. A compliance unit
// publishes delta = rcv*G + q_in*K_in - q_out*K_out. When the consumed and created resources have the same kind and
// quantity, delta = rcv*G, so whoever holds the sum of the rcv values of a transaction can show the transaction is
// balanced without learning any quantity.

#pragma once

#include <vector>

#include "cloak/Bytes32.hpp"
#include "cloak/Resource.hpp"
#include "SerializableByteArray.hpp"

namespace cloak {

// A curve point in SEC1 compressed form. The point at infinity is encoded as 33 zero bytes.
class ValueCommitment : public SerializableByteArray<33> {
 public:
  ValueCommitment() : SerializableByteArray<33>(ByteArray{}) {}
  ValueCommitment(const ByteArray& bytes) : SerializableByteArray<33>(bytes) {}

  // Throws InvalidInputLength or MalformedEncoding unless bytes hold a valid encoding.
  static ValueCommitment fromBuffer(const Bytes& bytes);

  bool isIdentity() const;

  bool operator==(const ValueCommitment& other) const { return bytes_ == other.bytes_; }
  bool operator!=(const ValueCommitment& other) const { return bytes_ != other.bytes_; }
};

std::ostream& operator<<(std::ostream& os, const ValueCommitment& v);

// True iff 0 < s < n, s read as a big-endian integer and n the secp256k1 group order.
bool isCanonicalScalar(const Bytes32& s);

// True iff q < n, q read as a big-endian integer. Only such quantities can be committed: q and q + n would
// otherwise produce the same delta.
bool isValidQuantity(const Bytes32& q);

// Generator of the resource kind (image_id, label).
ValueCommitment kindGenerator(const ImageId& image_id, const Bytes32& label);

// delta = rcv*G + q_in*K_in - q_out*K_out. Throws InputValidationError unless rcv is a canonical scalar and both
// quantities are valid.
ValueCommitment computeDelta(const Resource& consumed, const Resource& created, const Bytes32& rcv);

// rcv*G, what a balanced delta equals. Throws InputValidationError unless rcv is a canonical scalar.
ValueCommitment commitRandomness(const Bytes32& rcv);

// Point sum of the given commitments.
ValueCommitment sumValueCommitments(const std::vector<ValueCommitment>& commitments);

// Sum of scalars modulo n. The result may be zero.
Bytes32 sumScalars(const std::vector<Bytes32>& scalars);

void serialize(Bytes& output, const ValueCommitment& v);
void deserialize(const uint8_t*& start, const uint8_t* end, ValueCommitment& v);

}  // namespace cloak
