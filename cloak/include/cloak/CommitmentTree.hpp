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
#include <cstdint>
#include <vector>

#include "cloak/MerklePath.hpp"

namespace cloak {

/**
 * Append-only depth-32 Merkle tree of resource commitments, held in memory.
 *
 * Leaves are filled left to right. Positions not yet filled hold the all-zero leaf, so the root of an empty tree is
 * the root of 2^32 zero leaves. Paths produced by pathFor() are anchored at the root current at the time of the
 * call.
 *
 * Not thread safe; callers serialize access.
 */
class CommitmentTree {
 public:
  static constexpr uint64_t kCapacity = uint64_t{1} << kMerkleDepth;

  CommitmentTree();

  // Appends cm and returns its leaf index. Throws TreeFull once kCapacity leaves are stored.
  uint64_t insert(const Commitment& cm);

  // Throws InputValidationError if no leaf was inserted at leaf_index.
  MerklePath pathFor(uint64_t leaf_index) const;

  Bytes32 root() const;
  uint64_t size() const { return levels_[0].size(); }

  // Root of a subtree of the given height whose leaves are all zero.
  const Bytes32& emptyRoot(size_t height) const { return empty_[height]; }

 private:
  const Bytes32& nodeAt(size_t level, uint64_t index) const;

  // levels_[0] holds the leaves, levels_[kMerkleDepth] the root once the tree is non-empty.
  std::array<std::vector<Bytes32>, kMerkleDepth + 1> levels_;
  std::array<Bytes32, kMerkleDepth + 1> empty_;
};

}  // namespace cloak
