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

#include "gtest/gtest.h"

#include "cloak/CommitmentTree.hpp"
#include "cloak/MerklePath.hpp"
#include "cloak/Random.hpp"
#include "cloak/errors.hpp"
#include "sha_hash.hpp"

namespace {

using namespace cloak;

Bytes32 leaf(uint64_t i) {
  SeededRandomSource rng{i};
  return rng.random32();
}

TEST(merkle_path, bootstrap_path_layout) {
  const auto path = generateMerklePath32();
  ASSERT_FALSE(path.anchor().has_value());
  for (size_t i = 0; i < kMerkleDepth; i++) {
    const auto& step = path.steps()[i];
    ASSERT_EQ(i % 2 != 0, step.is_right);
    const auto& bytes = step.sibling.getBytes();
    for (size_t word = 0; word < 8; word++) {
      ASSERT_EQ(i + 1, static_cast<size_t>(bytes[word * 4]));
      ASSERT_EQ(0, bytes[word * 4 + 1]);
      ASSERT_EQ(0, bytes[word * 4 + 2]);
      ASSERT_EQ(0, bytes[word * 4 + 3]);
    }
  }
}

TEST(merkle_path, root_replays_each_level) {
  const auto path = generateMerklePath32();
  const auto start = leaf(1);
  Bytes32 node = start;
  for (const auto& step : path.steps()) {
    node = step.is_right ? Bytes32{util::sha256Of(step.sibling, node)} : Bytes32{util::sha256Of(node, step.sibling)};
  }
  ASSERT_EQ(node, path.root(start));
  ASSERT_NE(path.root(start), path.root(leaf(2)));
}

TEST(merkle_path, verify_needs_an_anchor) {
  const auto path = generateMerklePath32();
  const auto cm = leaf(1);
  ASSERT_FALSE(path.verify(cm));

  const auto anchored = path.anchoredAt(cm);
  ASSERT_EQ(path.root(cm), *anchored.anchor());
  ASSERT_TRUE(anchored.verify(cm));
  ASSERT_FALSE(anchored.verify(leaf(2)));
}

TEST(merkle_path, tampering_breaks_verification) {
  const auto cm = leaf(1);
  const auto anchored = generateMerklePath32().anchoredAt(cm);

  auto steps = anchored.steps();
  steps[5].is_right = !steps[5].is_right;
  ASSERT_FALSE(MerklePath(steps, anchored.anchor()).verify(cm));

  steps = anchored.steps();
  steps[31].sibling = leaf(3);
  ASSERT_FALSE(MerklePath(steps, anchored.anchor()).verify(cm));
}

TEST(merkle_path, encoding) {
  const auto plain = generateMerklePath32();
  const auto anchored = plain.anchoredAt(leaf(1));
  ASSERT_EQ(plain, MerklePath::decode(plain.encode()));
  ASSERT_EQ(anchored, MerklePath::decode(anchored.encode()));
  ASSERT_EQ(plain.encode().size() + Bytes32::ByteSize, anchored.encode().size());

  auto bytes = plain.encode();
  bytes.pop_back();
  ASSERT_THROW(MerklePath::decode(bytes), InvalidInputLength);

  // Direction flag of the first step.
  bytes = plain.encode();
  bytes[Bytes32::ByteSize] = 7;
  ASSERT_THROW(MerklePath::decode(bytes), MalformedEncoding);

  // Claims an anchor that is not there.
  bytes = plain.encode();
  bytes.back() = 1;
  ASSERT_THROW(MerklePath::decode(bytes), MalformedEncoding);
}

TEST(merkle_path, length_error_names_both_sizes) {
  const auto plain = generateMerklePath32().encode();
  try {
    MerklePath::decode(Bytes(plain.begin(), plain.end() - 1));
    FAIL() << "a short path was decoded";
  } catch (const InvalidInputLength& e) {
    const std::string what = e.what();
    ASSERT_EQ("merkle_path", e.field());
    ASSERT_NE(std::string::npos, what.find(std::to_string(plain.size())));
    ASSERT_NE(std::string::npos, what.find(std::to_string(plain.size() + Bytes32::ByteSize)));
  }
}

TEST(commitment_tree, empty_tree) {
  CommitmentTree tree;
  ASSERT_EQ(0u, tree.size());
  ASSERT_EQ(tree.emptyRoot(kMerkleDepth), tree.root());
  ASSERT_EQ(hashMerkleNodes(Bytes32{}, Bytes32{}), tree.emptyRoot(1));
  ASSERT_THROW(tree.pathFor(0), InputValidationError);
}

TEST(commitment_tree, first_levels) {
  CommitmentTree tree;
  const auto a = leaf(1);
  const auto b = leaf(2);
  ASSERT_EQ(0u, tree.insert(a));
  ASSERT_EQ(1u, tree.insert(b));

  const auto path_b = tree.pathFor(1);
  ASSERT_EQ(a, path_b.steps()[0].sibling);
  ASSERT_TRUE(path_b.steps()[0].is_right);
  ASSERT_EQ(tree.emptyRoot(1), path_b.steps()[1].sibling);
  ASSERT_FALSE(path_b.steps()[1].is_right);

  Bytes32 expected = hashMerkleNodes(a, b);
  for (size_t h = 1; h < kMerkleDepth; h++) expected = hashMerkleNodes(expected, tree.emptyRoot(h));
  ASSERT_EQ(expected, tree.root());
}

TEST(commitment_tree, every_leaf_has_a_valid_path) {
  CommitmentTree tree;
  for (uint64_t i = 0; i < 37; i++) tree.insert(leaf(i));
  for (uint64_t i = 0; i < tree.size(); i++) {
    const auto path = tree.pathFor(i);
    ASSERT_EQ(tree.root(), *path.anchor());
    ASSERT_TRUE(path.verify(leaf(i)));
    ASSERT_FALSE(path.verify(leaf(i + 100)));
  }
  ASSERT_THROW(tree.pathFor(37), InputValidationError);
}

TEST(commitment_tree, paths_stay_valid_for_their_anchor) {
  CommitmentTree tree;
  tree.insert(leaf(1));
  const auto old_root = tree.root();
  const auto old_path = tree.pathFor(0);

  tree.insert(leaf(2));
  ASSERT_NE(old_root, tree.root());
  ASSERT_TRUE(old_path.verify(leaf(1)));
  ASSERT_NE(tree.root(), old_path.root(leaf(1)));
  ASSERT_EQ(tree.root(), tree.pathFor(0).root(leaf(1)));
}

}  // namespace

int main(int argc, char** argv) {
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
