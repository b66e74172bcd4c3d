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

#include "cloak/Keys.hpp"
#include "cloak/errors.hpp"
#include "assertUtils.hpp"
#include "crypto/openssl/crypto.hpp"
#include "sha_hash.hpp"

namespace cloak {

using crypto::openssl::OPENSSL_SUCCESS;
using crypto::openssl::UniquePKEY;

namespace {
const std::string kNullifierKeyCommitmentDomain = "cloak.nullifier-key.commitment";
}

NullifierKey generateNsk(IRandomSource& rng) {
  auto nsk = rng.random32();
  while (nsk.isZero()) nsk = rng.random32();
  return nsk;
}

NullifierKeyCommitment commitNullifierKey(const NullifierKey& nsk) {
  return Bytes32{util::sha256Of(kNullifierKeyCommitmentDomain, nsk)};
}

Bytes32 derivePublicKey(const Bytes32& secret_key) {
  UniquePKEY pkey(EVP_PKEY_new_raw_private_key(EVP_PKEY_X25519, nullptr, secret_key.data(), secret_key.size()));
  if (!pkey) throw EncryptError("invalid X25519 secret key: " + crypto::openssl::lastOpenSSLError());
  Bytes32::ByteArray pub;
  size_t len = pub.size();
  crypto::openssl::OpenSSLAssert(EVP_PKEY_get_raw_public_key(pkey.get(), pub.data(), &len) == OPENSSL_SUCCESS,
                                 "failed to export X25519 public key");
  CloakAssertEQ(len, pub.size());
  return Bytes32{pub};
}

KeyPair generateKeyPair(IRandomSource& rng) {
  KeyPair kp;
  kp.secret_key = rng.random32();
  while (kp.secret_key.isZero()) kp.secret_key = rng.random32();
  kp.public_key = derivePublicKey(kp.secret_key);
  return kp;
}

}  // namespace cloak
