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

#include <algorithm>
#include <ostream>
#include <string>

#include "SerializableByteArray.hpp"
#include "types.hpp"
#include "wire.hpp"

namespace cloak {

// Every 32-byte protocol field: labels, nonces, quantities, keys, digests.
class Bytes32 : public SerializableByteArray<32> {
 public:
  Bytes32() : SerializableByteArray<32>(ByteArray{}) {}
  Bytes32(const ByteArray& bytes) : SerializableByteArray<32>(bytes) {}

  // Throws InvalidInputLength naming `field` unless len == 32.
  static Bytes32 fromBuffer(const Byte* data, size_t len, const std::string& field);
  static Bytes32 fromBuffer(const Bytes& bytes, const std::string& field) {
    return fromBuffer(bytes.data(), bytes.size(), field);
  }

  Bytes toBytes() const { return Bytes(bytes_.begin(), bytes_.end()); }
  bool isZero() const {
    return std::all_of(bytes_.begin(), bytes_.end(), [](Byte b) { return b == 0; });
  }

  bool operator==(const Bytes32& other) const { return bytes_ == other.bytes_; }
  bool operator!=(const Bytes32& other) const { return bytes_ != other.bytes_; }
  bool operator<(const Bytes32& other) const { return bytes_ < other.bytes_; }
};

using Commitment = Bytes32;
using Nullifier = Bytes32;
using NullifierKey = Bytes32;
using NullifierKeyCommitment = Bytes32;
using ImageId = Bytes32;

inline std::ostream& operator<<(std::ostream& os, const Bytes32& b) { return os << b.toHexString(); }

inline void serialize(Bytes& output, const Bytes32& b) { wire::serialize(output, b.getBytes()); }

inline void deserialize(const uint8_t*& start, const uint8_t* end, Bytes32& b) {
  Bytes32::ByteArray raw;
  wire::deserialize(start, end, raw);
  b = Bytes32{raw};
}

}  // namespace cloak
