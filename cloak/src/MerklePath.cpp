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

#include "cloak/MerklePath.hpp"
#include "cloak/errors.hpp"
#include "sha_hash.hpp"

namespace cloak {

// 32 steps of sibling + flag, then the optional anchor.
static constexpr size_t kMinEncodedSize = kMerkleDepth * (Bytes32::ByteSize + 1) + 1;
static constexpr size_t kMaxEncodedSize = kMinEncodedSize + Bytes32::ByteSize;

Bytes32 hashMerkleNodes(const Bytes32& left, const Bytes32& right) {
  return Bytes32{util::sha256Of(left, right)};
}

Bytes32 MerklePath::root(const Bytes32& leaf) const {
  Bytes32 node = leaf;
  for (const auto& step : steps_) {
    node = step.is_right ? hashMerkleNodes(step.sibling, node) : hashMerkleNodes(node, step.sibling);
  }
  return node;
}

MerklePath MerklePath::anchoredAt(const Bytes32& leaf) const { return MerklePath{steps_, root(leaf)}; }

bool MerklePath::verify(const Bytes32& leaf) const { return anchor_.has_value() && root(leaf) == *anchor_; }

MerklePath generateMerklePath32() {
  MerklePath::Steps steps;
  for (size_t i = 0; i < kMerkleDepth; i++) {
    Bytes32::ByteArray sibling{};
    for (size_t word = 0; word < 8; word++) {
      const uint32_t v = static_cast<uint32_t>(i + 1);
      sibling[word * 4 + 0] = static_cast<uint8_t>(v & 0xff);
      sibling[word * 4 + 1] = static_cast<uint8_t>((v >> 8) & 0xff);
      sibling[word * 4 + 2] = static_cast<uint8_t>((v >> 16) & 0xff);
      sibling[word * 4 + 3] = static_cast<uint8_t>((v >> 24) & 0xff);
    }
    steps[i] = MerkleStep{Bytes32{sibling}, i % 2 != 0};
  }
  return MerklePath{steps};
}

void serialize(Bytes& output, const MerklePath& path) {
  for (const auto& step : path.steps()) {
    serialize(output, step.sibling);
    wire::serialize(output, step.is_right);
  }
  wire::serialize(output, path.anchor());
}

MerklePath deserializeMerklePath(const uint8_t*& start, const uint8_t* end) {
  MerklePath::Steps steps;
  for (auto& step : steps) {
    deserialize(start, end, step.sibling);
    wire::deserialize(start, end, step.is_right);
  }
  std::optional<Bytes32> anchor;
  wire::deserialize(start, end, anchor);
  return MerklePath{steps, anchor};
}

Bytes MerklePath::encode() const {
  Bytes out;
  out.reserve(kMaxEncodedSize);
  serialize(out, *this);
  return out;
}

MerklePath MerklePath::decode(const Bytes& bytes) {
  if (bytes.size() != kMinEncodedSize && bytes.size() != kMaxEncodedSize) {
    throw InvalidInputLength(
        "merkle_path", std::to_string(kMinEncodedSize) + " or " + std::to_string(kMaxEncodedSize), bytes.size());
  }
  const uint8_t* start = bytes.data();
  const uint8_t* end = bytes.data() + bytes.size();
  try {
    auto path = deserializeMerklePath(start, end);
    wire::expectEnd(start, end);
    return path;
  } catch (const wire::DeserializeError& e) {
    throw MalformedEncoding("merkle_path", e.what());
  }
}

}  // namespace cloak
