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

#include "cloak/CommitmentTree.hpp"
#include "cloak/errors.hpp"
#include "assertUtils.hpp"
#include "Logger.hpp"
#include "kvstream.h"

namespace cloak {

CommitmentTree::CommitmentTree() {
  empty_[0] = Bytes32{};
  for (size_t h = 1; h <= kMerkleDepth; h++) {
    empty_[h] = hashMerkleNodes(empty_[h - 1], empty_[h - 1]);
  }
}

const Bytes32& CommitmentTree::nodeAt(size_t level, uint64_t index) const {
  const auto& nodes = levels_[level];
  return index < nodes.size() ? nodes[index] : empty_[level];
}

uint64_t CommitmentTree::insert(const Commitment& cm) {
  const uint64_t leaf_index = size();
  if (leaf_index >= kCapacity) throw TreeFull();
  levels_[0].push_back(cm);

  uint64_t index = leaf_index;
  for (size_t level = 0; level < kMerkleDepth; level++) {
    const uint64_t left = index & ~uint64_t{1};
    const Bytes32 parent = hashMerkleNodes(nodeAt(level, left), nodeAt(level, left + 1));
    index >>= 1;
    auto& parents = levels_[level + 1];
    if (index < parents.size()) {
      parents[index] = parent;
    } else {
      CloakAssertEQ(index, parents.size());
      parents.push_back(parent);
    }
  }
  LOG_DEBUG(MERKLE_LOG, KVLOG(leaf_index, cm));
  return leaf_index;
}

MerklePath CommitmentTree::pathFor(uint64_t leaf_index) const {
  if (leaf_index >= size()) {
    throw InputValidationError("no leaf at index " + std::to_string(leaf_index) + ", tree size " +
                               std::to_string(size()));
  }
  MerklePath::Steps steps;
  uint64_t index = leaf_index;
  for (size_t level = 0; level < kMerkleDepth; level++) {
    steps[level] = MerkleStep{nodeAt(level, index ^ 1), (index & 1) != 0};
    index >>= 1;
  }
  return MerklePath{steps, root()};
}

Bytes32 CommitmentTree::root() const { return nodeAt(kMerkleDepth, 0); }

}  // namespace cloak
