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

#include "cloak/Api.hpp"
#include "cloak/CommitmentTree.hpp"
#include "cloak/Config.hpp"
#include "cloak/Random.hpp"
#include "cloak/ValueCommitment.hpp"
#include "cloak/errors.hpp"

#include <filesystem>
#include <fstream>

namespace {

using namespace cloak;

std::string writeConfig(const std::string& name, const std::string& contents) {
  auto path = std::filesystem::path{::testing::TempDir()} / name;
  std::ofstream out(path);
  out << contents;
  return path.string();
}

class api_test : public ::testing::Test {
 protected:
  Bytes bytes32(uint8_t b) { return Bytes(32, b); }

  Bytes resourceFor(const Bytes& nsk, const Bytes& quantity) {
    return api->generateResource(
        bytes32(0x01), api->random32(), quantity, bytes32(0x02), false, nsk, bytes32(0x03), api->random32());
  }

  SeededRandomSource rng{5};
  std::unique_ptr<Api> api = Api::create(Config{}, rng);
};

TEST(config, defaults) {
  Config config;
  ASSERT_EQ(2u, config.prover_worker_threads);
  ASSERT_EQ(64u, config.prover_max_pending);
  ASSERT_EQ(std::chrono::milliseconds{60000}, config.prover_timeout);
  ASSERT_EQ("strict-quantity", config.conservation_policy);
  ASSERT_TRUE(config.logging_config_file.empty());
}

TEST(config, load) {
  auto config = Config::load(writeConfig("cloak.yaml",
                                         "# cloak\n"
                                         "prover.worker_threads: 3\n"
                                         "prover.timeout_ms: 1500\n"
                                         "compliance.conservation_policy: delta-balanced\n"
                                         "logging.config_file: log.properties\n"));
  ASSERT_EQ(3u, config.prover_worker_threads);
  ASSERT_EQ(std::chrono::milliseconds{1500}, config.prover_timeout);
  ASSERT_EQ(64u, config.prover_max_pending);
  ASSERT_EQ("delta-balanced", config.conservation_policy);
  ASSERT_EQ("log.properties", config.logging_config_file);
}

TEST(config, errors) {
  ASSERT_THROW(Config::load(writeConfig("bad_policy.yaml", "compliance.conservation_policy: lax\n")), ConfigError);
  ASSERT_THROW(Config::load(writeConfig("bad_threads.yaml", "prover.worker_threads: -1\n")), ConfigError);
  ASSERT_THROW(Config::load(writeConfig("zero_threads.yaml", "prover.worker_threads: 0\n")), ConfigError);
  ASSERT_THROW(Config::load(writeConfig("garbage.yaml", "no delimiter here\n")), ConfigError);
  ASSERT_THROW(Config::load((std::filesystem::path{::testing::TempDir()} / "absent.yaml").string()), ConfigError);
}

TEST_F(api_test, key_material) {
  const auto nsk = api->generateNsk();
  ASSERT_EQ(32u, nsk.size());
  ASSERT_NE(nsk, api->generateNsk());
  ASSERT_EQ(32u, api->generateNpk(nsk).size());
  ASSERT_NE(nsk, api->generateNpk(nsk));
  ASSERT_THROW(api->generateNpk(Bytes(16, 0)), InvalidInputLength);

  const auto [sk, pk] = api->generateKeypair();
  ASSERT_EQ(32u, sk.size());
  ASSERT_EQ(32u, pk.size());
  ASSERT_NE(sk, pk);
}

TEST_F(api_test, generate_resource_checks_every_field) {
  const auto nsk = api->generateNsk();
  const auto ok = bytes32(1);
  const Bytes bad(31, 1);
  ASSERT_EQ(Resource::kEncodedSize, api->generateResource(ok, ok, ok, ok, true, nsk, ok, ok).size());

  const char* fields[] = {"label", "nonce", "quantity", "value", "nsk", "image_id", "rand_seed"};
  for (int i = 0; i < 7; i++) {
    try {
      api->generateResource(i == 0 ? bad : ok,
                            i == 1 ? bad : ok,
                            i == 2 ? bad : ok,
                            i == 3 ? bad : ok,
                            false,
                            i == 4 ? bad : nsk,
                            i == 5 ? bad : ok,
                            i == 6 ? bad : ok);
      FAIL() << fields[i] << " was not checked";
    } catch (const InvalidInputLength& e) {
      ASSERT_EQ(fields[i], e.field());
    }
  }
}

TEST_F(api_test, transfer_end_to_end) {
  const auto sender_nsk = api->generateNsk();
  const auto receiver_nsk = api->generateNsk();
  const auto consumed = resourceFor(sender_nsk, bytes32(0x07));
  const auto created = resourceFor(receiver_nsk, bytes32(0x07));

  CommitmentTree tree;
  const auto index = tree.insert(Resource::decode(consumed).commitment());
  const auto path = tree.pathFor(index).encode();

  Bytes32::ByteArray rcv_raw{};
  rcv_raw[31] = 9;
  const Bytes rcv(rcv_raw.begin(), rcv_raw.end());

  const auto witness = api->generateComplianceCircuit(consumed, created, rcv, path, sender_nsk);
  const auto receipt = api->prove(witness, api->complianceGuestBinary());
  ASSERT_TRUE(api->verify(receipt, api->complianceImageId().toBytes()));
  ASSERT_FALSE(api->verify(receipt, bytes32(0)));
  ASSERT_THROW(api->verify(receipt, Bytes(31, 0)), VerifyError);
  ASSERT_THROW(api->verify(Bytes{1, 2}, api->complianceImageId().toBytes()), VerifyError);

  const auto instance = api->getComplianceInstance(receipt);
  ASSERT_EQ(Resource::decode(consumed).nullifier(Bytes32::fromBuffer(sender_nsk, "nsk")), instance.nullifier);
  ASSERT_EQ(Resource::decode(created).commitment(), instance.created_commitment);
  ASSERT_EQ(tree.root(), instance.merkle_root);
  ASSERT_EQ(commitRandomness(Bytes32{rcv_raw}), instance.delta);
}

TEST_F(api_test, invalid_transfer_fails_to_prove) {
  const auto nsk = api->generateNsk();
  const auto consumed = resourceFor(nsk, bytes32(0x07));
  const auto created = resourceFor(nsk, bytes32(0x08));
  const auto witness =
      api->generateComplianceCircuit(consumed, created, bytes32(0x01), api->generateMerklePath32(), nsk);
  ASSERT_THROW(api->prove(witness, api->complianceGuestBinary()), ProveError);
}

TEST_F(api_test, witness_assembly_errors) {
  const auto nsk = api->generateNsk();
  const auto r = resourceFor(nsk, bytes32(0x07));
  ASSERT_THROW(api->generateComplianceCircuit(r, r, bytes32(0), api->generateMerklePath32(), nsk),
               WitnessAssemblyError);
  ASSERT_THROW(api->generateComplianceCircuit(r, Bytes(3, 0), bytes32(1), api->generateMerklePath32(), nsk),
               WitnessAssemblyError);
}

TEST_F(api_test, padding_resource_logic) {
  const auto nsk = api->generateNsk();
  const auto padding = api->generateResource(
      bytes32(0x01), api->random32(), bytes32(0), bytes32(0), true, nsk, api->logicImageId().toBytes(), api->random32());
  const auto path = api->generateMerklePath32();

  const auto receipt = api->prove(api->generateLogicWitness(padding, path, nsk, true), api->logicGuestBinary());
  ASSERT_TRUE(api->verify(receipt, api->logicImageId().toBytes()));
  ASSERT_FALSE(api->verify(receipt, api->complianceImageId().toBytes()));

  const auto instance = api->getLogicInstance(receipt);
  const auto nf = Resource::decode(padding).nullifier(Bytes32::fromBuffer(nsk, "nsk"));
  ASSERT_TRUE(instance.is_consumed);
  ASSERT_EQ(nf, instance.tag);
  ASSERT_EQ(MerklePath::decode(path).root(nf), instance.root);
  ASSERT_THROW(api->getComplianceInstance(receipt), VerifyError);

  ASSERT_NE(api->complianceImageId(), api->logicImageId());
  ASSERT_THROW(api->generateLogicWitness(padding, Bytes(5, 0), nsk, false), WitnessAssemblyError);
}

TEST_F(api_test, encryption) {
  const auto [alice_sk, alice_pk] = api->generateKeypair();
  const auto [bob_sk, bob_pk] = api->generateKeypair();
  const Bytes nonce(12, 0x42);
  const Bytes message{1, 2, 3, 4};
  const auto cipher = api->encrypt(message, bob_pk, alice_sk, nonce);
  Bytes plain;
  ASSERT_TRUE(api->decrypt(cipher, alice_pk, bob_sk, nonce, plain).isOK());
  ASSERT_EQ(message, plain);
}

}  // namespace

int main(int argc, char** argv) {
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
