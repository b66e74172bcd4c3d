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

#include "crypto/crypto.hpp"
#include "crypto/openssl/EdDSA.hpp"
#include "crypto/openssl/EdDSASigner.hpp"
#include "crypto/openssl/EdDSAVerifier.hpp"

#include <string>
#include <vector>

namespace {

using namespace cloak::crypto;
using namespace cloak::crypto::openssl;

using Signer = EdDSASigner<EdDSAPrivateKey>;
using Verifier = EdDSAVerifier<EdDSAPublicKey>;

std::pair<Signer, Verifier> makeKeys() {
  const auto [priv, pub] = generateEdDSAKeyPair();
  return {Signer{fromHexString<EdDSAPrivateKey>(priv)}, Verifier{fromHexString<EdDSAPublicKey>(pub)}};
}

std::vector<uint8_t> sign(const Signer& signer, const std::string& msg) {
  std::vector<uint8_t> sig(signer.signatureLength());
  const auto len = signer.sign(msg, sig.data());
  EXPECT_EQ(Ed25519SignatureByteSize, len);
  return sig;
}

TEST(eddsa, generated_keys_are_hex_of_the_right_size) {
  const auto [priv, pub] = generateEdDSAKeyPair();
  ASSERT_EQ(2 * Ed25519PrivateKeyByteSize, priv.size());
  ASSERT_EQ(2 * Ed25519PublicKeyByteSize, pub.size());
  ASSERT_NE(generateEdDSAKeyPair().first, priv);
}

TEST(eddsa, derived_public_key_matches_the_generated_one) {
  const auto [priv, pub] = generateEdDSAKeyPair();
  ASSERT_EQ(pub, deriveEdDSAPublicKey(fromHexString<EdDSAPrivateKey>(priv)).toHexString());
}

TEST(eddsa, sign_and_verify) {
  auto [signer, verifier] = makeKeys();
  const std::string msg = "cloak.receipt.claim";
  const auto sig = sign(signer, msg);
  ASSERT_TRUE(verifier.verify(msg, std::string(sig.begin(), sig.end())));
  ASSERT_TRUE(verifier.verifyBuffer(
      reinterpret_cast<const cloak::Byte*>(msg.data()), msg.size(), sig.data(), sig.size()));
}

TEST(eddsa, tampered_message_or_signature_fails) {
  auto [signer, verifier] = makeKeys();
  const std::string msg = "journal";
  auto sig = sign(signer, msg);
  const std::string other = "journaL";
  ASSERT_FALSE(verifier.verifyBuffer(
      reinterpret_cast<const cloak::Byte*>(other.data()), other.size(), sig.data(), sig.size()));
  sig[0] ^= 0x01;
  ASSERT_FALSE(verifier.verifyBuffer(
      reinterpret_cast<const cloak::Byte*>(msg.data()), msg.size(), sig.data(), sig.size()));
}

TEST(eddsa, wrong_key_or_signature_length_fails) {
  auto [signer, verifier] = makeKeys();
  auto [other_signer, other_verifier] = makeKeys();
  const std::string msg = "journal";
  const auto sig = sign(signer, msg);
  const auto* data = reinterpret_cast<const cloak::Byte*>(msg.data());
  ASSERT_FALSE(other_verifier.verifyBuffer(data, msg.size(), sig.data(), sig.size()));
  ASSERT_FALSE(verifier.verifyBuffer(data, msg.size(), sig.data(), sig.size() - 1));
}

TEST(eddsa, malformed_hex_keys_are_rejected) {
  ASSERT_THROW(fromHexString<EdDSAPublicKey>("abcd"), std::invalid_argument);
  ASSERT_THROW(fromHexString<EdDSAPublicKey>(std::string(64, 'z')), std::invalid_argument);
}

}  // namespace

int main(int argc, char** argv) {
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
