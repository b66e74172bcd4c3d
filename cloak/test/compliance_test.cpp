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
#include "cloak/Compliance.hpp"
#include "cloak/ConservationPolicy.hpp"
#include "cloak/GuestProgram.hpp"
#include "cloak/Keys.hpp"
#include "cloak/ProofEngine.hpp"
#include "cloak/Random.hpp"
#include "cloak/ValueCommitment.hpp"
#include "cloak/errors.hpp"

#include <memory>

namespace {

using namespace cloak;

Bytes32 quantity(uint64_t q) {
  Bytes32::ByteArray raw{};
  for (int i = 0; i < 8; i++) raw[31 - i] = static_cast<uint8_t>(q >> (8 * i));
  return Bytes32{raw};
}

class compliance_test : public ::testing::Test {
 protected:
  void SetUp() override {
    registry = std::make_shared<GuestRegistry>();
    strict_guest = std::make_shared<ComplianceGuest>(std::make_shared<StrictQuantityConservation>());
    registry->add(strict_guest);
    engine = AttestedProofEngine::create(registry, rng);

    // A few unrelated commitments around the one being spent.
    for (uint64_t i = 0; i < 3; i++) tree.insert(rng.random32());
    leaf_index = tree.insert(consumed.commitment());
    tree.insert(rng.random32());
  }

  Resource resource(uint64_t q, const NullifierKey& owner) {
    return generateResource(label, rng.random32(), quantity(q), rng.random32(), false, owner, logic, rng.random32());
  }

  Bytes witnessFor(const Resource& in, const Resource& out, const MerklePath& path, const NullifierKey& key) {
    return generateComplianceCircuit(in.encode(), out.encode(), rcv.toBytes(), path.encode(), key.toBytes());
  }

  Bytes witnessFor(const Resource& out) { return witnessFor(consumed, out, tree.pathFor(leaf_index), sender_nsk); }

  SeededRandomSource rng{2024};
  const NullifierKey sender_nsk = generateNsk(rng);
  const NullifierKey receiver_nsk = generateNsk(rng);
  const Bytes32 label = rng.random32();
  const ImageId logic = rng.random32();
  const Bytes32 rcv = rng.random32();
  const Resource consumed = resource(100, sender_nsk);
  const Resource created = resource(100, receiver_nsk);

  CommitmentTree tree;
  uint64_t leaf_index = 0;
  std::shared_ptr<GuestRegistry> registry;
  std::shared_ptr<ComplianceGuest> strict_guest;
  std::shared_ptr<AttestedProofEngine> engine;
};

TEST_F(compliance_test, witness_encoding) {
  const auto witness = witnessFor(created);
  const auto decoded = ComplianceWitness::decode(witness);
  ASSERT_EQ(consumed, decoded.consumed);
  ASSERT_EQ(created, decoded.created);
  ASSERT_EQ(rcv, decoded.rcv);
  ASSERT_EQ(sender_nsk, decoded.nsk);
  ASSERT_EQ(tree.root(), *decoded.merkle_path.anchor());

  auto truncated = witness;
  truncated.pop_back();
  ASSERT_THROW(ComplianceWitness::decode(truncated), MalformedEncoding);
}

TEST_F(compliance_test, witness_assembly_rejects_bad_input) {
  const auto path = tree.pathFor(leaf_index).encode();
  const auto in = consumed.encode();
  const auto out = created.encode();
  const auto nsk = sender_nsk.toBytes();

  ASSERT_THROW(generateComplianceCircuit(in, out, Bytes32{}.toBytes(), path, nsk), WitnessAssemblyError);
  ASSERT_THROW(generateComplianceCircuit(in, out, Bytes(32, 0xff), path, nsk), WitnessAssemblyError);
  ASSERT_THROW(generateComplianceCircuit(in, out, Bytes(31, 1), path, nsk), WitnessAssemblyError);
  ASSERT_THROW(generateComplianceCircuit(Bytes(in.begin(), in.end() - 1), out, rcv.toBytes(), path, nsk),
               WitnessAssemblyError);
  ASSERT_THROW(generateComplianceCircuit(in, out, rcv.toBytes(), Bytes(10, 0), nsk), WitnessAssemblyError);
  ASSERT_THROW(generateComplianceCircuit(in, out, rcv.toBytes(), path, Bytes(33, 0)), WitnessAssemblyError);
}

TEST_F(compliance_test, prove_and_verify) {
  const auto receipt = engine->prove(witnessFor(created), strict_guest->binary());
  ASSERT_TRUE(engine->verify(receipt, strict_guest->imageId()));
  ASSERT_TRUE(engine->verifier().verify(receipt, strict_guest->imageId()));

  const auto instance = decodeComplianceInstance(receipt);
  ASSERT_EQ(consumed.nullifier(sender_nsk), instance.nullifier);
  ASSERT_EQ(created.commitment(), instance.created_commitment);
  ASSERT_EQ(logic, instance.consumed_image_id);
  ASSERT_EQ(logic, instance.created_image_id);
  ASSERT_EQ(tree.root(), instance.merkle_root);
  ASSERT_EQ(commitRandomness(rcv), instance.delta);
  ASSERT_EQ(instance, ComplianceInstance::decode(instance.encode()));
}

TEST_F(compliance_test, journal_is_deterministic) {
  const auto witness = witnessFor(created);
  const auto first = engine->prove(witness, strict_guest->binary());
  const auto second = engine->prove(witness, strict_guest->binary());
  ASSERT_EQ(first.journal, second.journal);
  ASSERT_EQ(first, Receipt::decode(first.encode()));
}

TEST_F(compliance_test, bootstrap_path_publishes_its_root) {
  const auto path = generateMerklePath32();
  const auto receipt = engine->prove(witnessFor(consumed, created, path, sender_nsk), strict_guest->binary());
  ASSERT_EQ(path.root(consumed.commitment()), decodeComplianceInstance(receipt).merkle_root);
}

TEST_F(compliance_test, rejected_receipts) {
  const auto receipt = engine->prove(witnessFor(created), strict_guest->binary());

  ASSERT_FALSE(engine->verify(receipt, logic));

  auto tampered = receipt;
  tampered.journal[0] ^= 0x01;
  ASSERT_FALSE(engine->verify(tampered, strict_guest->imageId()));

  tampered = receipt;
  tampered.seal.back() ^= 0x01;
  ASSERT_FALSE(engine->verify(tampered, strict_guest->imageId()));

  auto other_engine = AttestedProofEngine::create(registry, rng);
  ASSERT_FALSE(other_engine->verify(receipt, strict_guest->imageId()));
}

TEST_F(compliance_test, malformed_receipts) {
  auto receipt = engine->prove(witnessFor(created), strict_guest->binary());
  receipt.seal.pop_back();
  ASSERT_THROW(engine->verify(receipt, strict_guest->imageId()), VerifyError);
  ASSERT_THROW(Receipt::decode(Bytes{0, 0, 0, 9, 1}), VerifyError);

  Receipt not_compliance{receipt.seal, Bytes{1, 2, 3}};
  ASSERT_THROW(decodeComplianceInstance(not_compliance), VerifyError);
}

TEST_F(compliance_test, quantity_mismatch_fails_to_prove) {
  const auto inflated = resource(101, receiver_nsk);
  ASSERT_THROW(engine->prove(witnessFor(inflated), strict_guest->binary()), ProveError);
}

TEST_F(compliance_test, label_mismatch_fails_to_prove) {
  const auto other_kind =
      generateResource(rng.random32(), rng.random32(), quantity(100), Bytes32{}, false, receiver_nsk, logic,
                       rng.random32());
  ASSERT_THROW(engine->prove(witnessFor(other_kind), strict_guest->binary()), ProveError);
}

TEST_F(compliance_test, tampered_path_fails_to_prove) {
  const auto path = tree.pathFor(leaf_index);
  auto steps = path.steps();
  steps[0].sibling = rng.random32();
  const MerklePath tampered{steps, path.anchor()};
  ASSERT_THROW(engine->prove(witnessFor(consumed, created, tampered, sender_nsk), strict_guest->binary()),
               ProveError);

  // A path for another leaf does not lead to the anchor either.
  ASSERT_THROW(engine->prove(witnessFor(consumed, created, tree.pathFor(0), sender_nsk), strict_guest->binary()),
               ProveError);
}

TEST_F(compliance_test, wrong_nullifier_key_fails_to_prove) {
  ASSERT_THROW(
      engine->prove(witnessFor(consumed, created, tree.pathFor(leaf_index), receiver_nsk), strict_guest->binary()),
      ProveError);
}

TEST_F(compliance_test, garbage_input_fails_to_prove) {
  ASSERT_THROW(engine->prove(Bytes{1, 2, 3}, strict_guest->binary()), ProveError);
}

TEST_F(compliance_test, unknown_guest_is_an_engine_failure) {
  const Bytes unknown{'n', 'o', 'p', 'e'};
  try {
    engine->prove(witnessFor(created), unknown);
    FAIL() << "an unregistered guest was run";
  } catch (const ProveError&) {
    FAIL() << "an unregistered guest is not a guest abort";
  } catch (const ProofEngineFailure&) {
  }
}

TEST_F(compliance_test, policy_is_bound_to_the_image_id) {
  auto balanced_guest = std::make_shared<ComplianceGuest>(std::make_shared<DeltaBalancedConservation>());
  ASSERT_NE(strict_guest->imageId(), balanced_guest->imageId());
  ASSERT_EQ(strict_guest->imageId(), registry->add(strict_guest));
  registry->add(balanced_guest);
  ASSERT_EQ(2u, registry->size());

  const auto change = resource(60, receiver_nsk);
  const auto receipt = engine->prove(witnessFor(change), balanced_guest->binary());
  ASSERT_TRUE(engine->verify(receipt, balanced_guest->imageId()));
  ASSERT_FALSE(engine->verify(receipt, strict_guest->imageId()));
  ASSERT_NE(commitRandomness(rcv), decodeComplianceInstance(receipt).delta);
}

TEST_F(compliance_test, tampered_bootstrap_path_changes_the_published_root) {
  const auto path = generateMerklePath32();
  auto steps = path.steps();
  steps[3].sibling = rng.random32();
  const MerklePath tampered{steps};

  const auto receipt = engine->prove(witnessFor(consumed, created, tampered, sender_nsk), strict_guest->binary());
  ASSERT_TRUE(engine->verify(receipt, strict_guest->imageId()));
  const auto published = decodeComplianceInstance(receipt).merkle_root;
  ASSERT_EQ(tampered.root(consumed.commitment()), published);
  ASSERT_NE(path.root(consumed.commitment()), published);
}

TEST_F(compliance_test, delta_balanced_transfer) {
  auto balanced_guest = std::make_shared<ComplianceGuest>(std::make_shared<DeltaBalancedConservation>());
  registry->add(balanced_guest);

  const auto change = resource(60, receiver_nsk);
  const auto receipt = engine->prove(witnessFor(change), balanced_guest->binary());
  ASSERT_TRUE(engine->verify(receipt, balanced_guest->imageId()));
  ASSERT_EQ(computeDelta(consumed, change, rcv), decodeComplianceInstance(receipt).delta);

  const auto equal = engine->prove(witnessFor(created), balanced_guest->binary());
  ASSERT_EQ(commitRandomness(rcv), decodeComplianceInstance(equal).delta);
}

// Quantities are committed modulo the group order n, so n + 5 must not pass for 5.
TEST_F(compliance_test, quantity_above_group_order_is_rejected) {
  auto balanced_guest = std::make_shared<ComplianceGuest>(std::make_shared<DeltaBalancedConservation>());
  registry->add(balanced_guest);

  const auto n_plus_5 = fromHexString<Bytes32>("fffffffffffffffffffffffffffffffebaaedce6af48a03bbfd25e8cd0364146");
  const auto n_minus_1 = fromHexString<Bytes32>("fffffffffffffffffffffffffffffffebaaedce6af48a03bbfd25e8cd0364140");
  ASSERT_FALSE(isValidQuantity(n_plus_5));
  ASSERT_TRUE(isValidQuantity(n_minus_1));

  const auto five = resource(5, sender_nsk);
  CommitmentTree spent;
  const auto index = spent.insert(five.commitment());
  const auto path = spent.pathFor(index);
  const auto inflated =
      generateResource(label, rng.random32(), n_plus_5, rng.random32(), false, receiver_nsk, logic, rng.random32());

  ASSERT_THROW(witnessFor(five, inflated, path, sender_nsk), WitnessAssemblyError);
  ASSERT_THROW(computeDelta(five, inflated, rcv), InputValidationError);

  // A witness assembled without the host side checks is refused by the guest.
  const ComplianceWitness forged{five, inflated, rcv, path, sender_nsk};
  ASSERT_THROW(engine->prove(forged.encode(), balanced_guest->binary()), ProveError);
  const ComplianceWitness forged_input{inflated, five, rcv, MerklePath{}, receiver_nsk};
  ASSERT_THROW(engine->prove(forged_input.encode(), balanced_guest->binary()), ProveError);
}

}  // namespace

int main(int argc, char** argv) {
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
