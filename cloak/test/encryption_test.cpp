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

#include "cloak/Encryption.hpp"
#include "cloak/Keys.hpp"
#include "cloak/Random.hpp"
#include "cloak/errors.hpp"

#include <string>

namespace {

using namespace cloak;

class encryption_test : public ::testing::Test {
 protected:
  Bytes nonce() {
    Bytes n(12);
    rng.fill(n.data(), n.size());
    return n;
  }

  SeededRandomSource rng{99};
  const KeyPair alice = generateKeyPair(rng);
  const KeyPair bob = generateKeyPair(rng);
  const Bytes message{'s', 'h', 'i', 'e', 'l', 'd', 'e', 'd'};
};

TEST_F(encryption_test, round_trip) {
  const auto n = nonce();
  const auto cipher = encrypt(message, bob.public_key.toBytes(), alice.secret_key.toBytes(), n);
  ASSERT_EQ(message.size() + 16, cipher.size());

  Bytes plain;
  auto status = decrypt(cipher, alice.public_key.toBytes(), bob.secret_key.toBytes(), n, plain);
  ASSERT_TRUE(status.isOK()) << status;
  ASSERT_EQ(message, plain);
}

TEST_F(encryption_test, empty_message) {
  const auto n = nonce();
  const auto cipher = encrypt(Bytes{}, bob.public_key.toBytes(), alice.secret_key.toBytes(), n);
  ASSERT_EQ(16u, cipher.size());
  Bytes plain{1};
  ASSERT_TRUE(decrypt(cipher, alice.public_key.toBytes(), bob.secret_key.toBytes(), n, plain).isOK());
  ASSERT_TRUE(plain.empty());
}

TEST_F(encryption_test, tampered_ciphertext_or_nonce) {
  auto n = nonce();
  const auto cipher = encrypt(message, bob.public_key.toBytes(), alice.secret_key.toBytes(), n);
  const Bytes untouched{0xde, 0xad};

  for (size_t i = 0; i < cipher.size(); i++) {
    auto flipped = cipher;
    flipped[i] ^= 0x01;
    Bytes plain = untouched;
    auto status = decrypt(flipped, alice.public_key.toBytes(), bob.secret_key.toBytes(), n, plain);
    ASSERT_TRUE(status.isAuthenticationFailure()) << "byte " << i;
    ASSERT_EQ(untouched, plain);
  }

  n[0] ^= 0x80;
  Bytes plain = untouched;
  ASSERT_TRUE(decrypt(cipher, alice.public_key.toBytes(), bob.secret_key.toBytes(), n, plain)
                  .isAuthenticationFailure());
  ASSERT_EQ(untouched, plain);
}

TEST_F(encryption_test, wrong_keys_fail_authentication) {
  const auto n = nonce();
  const auto cipher = encrypt(message, bob.public_key.toBytes(), alice.secret_key.toBytes(), n);
  const auto eve = generateKeyPair(rng);
  Bytes plain;
  ASSERT_TRUE(decrypt(cipher, alice.public_key.toBytes(), eve.secret_key.toBytes(), n, plain)
                  .isAuthenticationFailure());
  ASSERT_TRUE(decrypt(Bytes(15, 0), alice.public_key.toBytes(), bob.secret_key.toBytes(), n, plain)
                  .isAuthenticationFailure());
  ASSERT_TRUE(plain.empty());
}

TEST_F(encryption_test, small_order_public_key_is_rejected) {
  const Bytes zero_point(32, 0);
  const auto n = nonce();
  ASSERT_THROW(encrypt(message, zero_point, alice.secret_key.toBytes(), n), EncryptError);
  Bytes plain;
  ASSERT_TRUE(decrypt(Bytes(32, 0), zero_point, bob.secret_key.toBytes(), n, plain).isAuthenticationFailure());
}

TEST_F(encryption_test, lengths_are_checked) {
  const auto pk = bob.public_key.toBytes();
  const auto sk = alice.secret_key.toBytes();
  const auto n = nonce();
  ASSERT_THROW(encrypt(message, Bytes(31, 1), sk, n), EncryptError);
  ASSERT_THROW(encrypt(message, pk, Bytes(33, 1), n), EncryptError);
  ASSERT_THROW(encrypt(message, pk, sk, Bytes(16, 1)), EncryptError);

  Bytes plain;
  ASSERT_THROW(decrypt(message, Bytes(31, 1), sk, n, plain), DecryptError);
  ASSERT_THROW(decrypt(message, pk, Bytes{}, n, plain), DecryptError);
  ASSERT_THROW(decrypt(message, pk, sk, Bytes(11, 1), plain), DecryptError);
}

TEST_F(encryption_test, resource_ciphertext) {
  const auto nsk = generateNsk(rng);
  const auto resource =
      generateResource(rng.random32(), rng.random32(), rng.random32(), rng.random32(), true, nsk, rng.random32(),
                       rng.random32());
  const auto rc = encryptResource(resource, bob.public_key, alice, rng);
  const auto decoded = ResourceCiphertext::decode(rc.encode());
  ASSERT_EQ(alice.public_key, decoded.sender_public_key);

  std::optional<Resource> out;
  ASSERT_TRUE(decryptResource(decoded, bob.secret_key, out).isOK());
  ASSERT_EQ(resource, out.value());

  std::optional<Resource> stolen;
  ASSERT_TRUE(decryptResource(decoded, alice.secret_key, stolen).isAuthenticationFailure());
  ASSERT_FALSE(stolen.has_value());

  // Authentic, but not a resource.
  ResourceCiphertext not_a_resource = decoded;
  not_a_resource.ciphertext = encrypt(Bytes{1, 2, 3},
                                      bob.public_key.toBytes(),
                                      alice.secret_key.toBytes(),
                                      Bytes(decoded.nonce.begin(), decoded.nonce.end()));
  ASSERT_TRUE(decryptResource(not_a_resource, bob.secret_key, stolen).isInvalidArgument());

  auto bytes = rc.encode();
  bytes.push_back(0);
  ASSERT_THROW(ResourceCiphertext::decode(bytes), MalformedEncoding);
}

}  // namespace

int main(int argc, char** argv) {
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
