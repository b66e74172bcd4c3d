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

#include <array>
#include <optional>

#include "cloak/Bytes32.hpp"
#include "types.hpp"

namespace cloak {

constexpr size_t kMerkleDepth = 32;

// Interior node hash: SHA-256(left || right).
Bytes32 hashMerkleNodes(const Bytes32& left, const Bytes32& right);

// One level of a membership path, from the leaf upwards.
struct MerkleStep {
  Bytes32 sibling;
  // false: the running node is the left child, true: it is the right child.
  bool is_right = false;

  bool operator==(const MerkleStep& other) const { return sibling == other.sibling && is_right == other.is_right; }
};

/**
 * Membership path of a leaf in a depth-32 binary tree.
 *
 * A path may carry the root it was issued against (its anchor). The compliance guest checks a commitment against
 * the anchor; a path without one only publishes the root it computes.
 */
class MerklePath {
 public:
  using Steps = std::array<MerkleStep, kMerkleDepth>;

  MerklePath() = default;
  explicit MerklePath(const Steps& steps, std::optional<Bytes32> anchor = std::nullopt)
      : steps_{steps}, anchor_{std::move(anchor)} {}

  const Steps& steps() const { return steps_; }
  const std::optional<Bytes32>& anchor() const { return anchor_; }

  // Folds the 32 steps starting from leaf.
  Bytes32 root(const Bytes32& leaf) const;

  // A copy of this path anchored at root(leaf).
  MerklePath anchoredAt(const Bytes32& leaf) const;

  // True iff the path has an anchor and root(leaf) equals it.
  bool verify(const Bytes32& leaf) const;

  Bytes encode() const;
  // Throws InvalidInputLength / MalformedEncoding.
  static MerklePath decode(const Bytes& bytes);

  bool operator==(const MerklePath& other) const { return steps_ == other.steps_ && anchor_ == other.anchor_; }

 private:
  Steps steps_{};
  std::optional<Bytes32> anchor_;
};

// Deterministic bootstrap path for standalone use: sibling i is eight little-endian 32-bit words equal to i + 1,
// and the running node is a right child at odd levels. It has no anchor.
MerklePath generateMerklePath32();

void serialize(Bytes& output, const MerklePath& path);
MerklePath deserializeMerklePath(const uint8_t*& start, const uint8_t* end);

}  // namespace cloak
