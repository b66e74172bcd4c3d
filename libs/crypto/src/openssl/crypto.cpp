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
// terms and conditions of the subcomponent's license, as noted in the
// LICENSE file.

#include "crypto/openssl/crypto.hpp"
#include "crypto/openssl/EdDSA.hpp"
#include "assertUtils.hpp"
#include "hex_tools.h"
#include "types.hpp"

#include <openssl/err.h>

#include <array>

namespace cloak::crypto::openssl {

using std::pair;
using std::string;
using std::array;

using cloak::Byte;

void OpenSSLAssert(bool expr, const std::string& msg) {
  if (!expr) {
    throw OpenSSLError(msg + ": " + lastOpenSSLError());
  }
}

string lastOpenSSLError() {
  const unsigned long code = ERR_get_error();
  ERR_clear_error();
  if (code == 0) return "no OpenSSL error reported";
  array<char, 256> buf{};
  ERR_error_string_n(code, buf.data(), buf.size());
  return string(buf.data());
}

EdDSAPublicKey deriveEdDSAPublicKey(const EdDSAPrivateKey& privateKey) {
  UniquePKEY pkey(EVP_PKEY_new_raw_private_key(
      NID_ED25519, nullptr, privateKey.getBytes().data(), privateKey.getBytes().size()));
  OpenSSLAssert(pkey != nullptr, "failed to load Ed25519 private key");
  EdDSAPublicKey::ByteArray pubKey;
  size_t keyLen{pubKey.size()};
  OpenSSLAssert(EVP_PKEY_get_raw_public_key(pkey.get(), pubKey.data(), &keyLen) == OPENSSL_SUCCESS,
                "failed to export Ed25519 public key");
  CloakAssertEQ(keyLen, Ed25519PublicKeyByteSize);
  return EdDSAPublicKey{pubKey};
}

}  // namespace cloak::crypto::openssl

namespace cloak::crypto {

using namespace cloak::crypto::openssl;

pair<string, string> generateEdDSAKeyPair() {
  UniquePKEYContext edPkeyCtx(EVP_PKEY_CTX_new_id(NID_ED25519, nullptr));
  OpenSSLAssert(edPkeyCtx != nullptr, "failed to allocate an Ed25519 key context");
  OpenSSLAssert(EVP_PKEY_keygen_init(edPkeyCtx.get()) == OPENSSL_SUCCESS, "EVP_PKEY_keygen_init failed");
  EVP_PKEY* keygenRet = nullptr;
  OpenSSLAssert(EVP_PKEY_keygen(edPkeyCtx.get(), &keygenRet) == OPENSSL_SUCCESS, "EVP_PKEY_keygen failed");
  UniquePKEY edPkey(keygenRet);

  array<Byte, Ed25519PrivateKeyByteSize> privKey;
  array<Byte, Ed25519PublicKeyByteSize> pubKey;
  size_t keyLen{Ed25519PrivateKeyByteSize};
  OpenSSLAssert(EVP_PKEY_get_raw_private_key(edPkey.get(), privKey.data(), &keyLen) == OPENSSL_SUCCESS,
                "failed to export Ed25519 private key");
  CloakAssertEQ(keyLen, Ed25519PrivateKeyByteSize);
  keyLen = Ed25519PublicKeyByteSize;
  OpenSSLAssert(EVP_PKEY_get_raw_public_key(edPkey.get(), pubKey.data(), &keyLen) == OPENSSL_SUCCESS,
                "failed to export Ed25519 public key");
  CloakAssertEQ(keyLen, Ed25519PublicKeyByteSize);

  return {util::bufferToHex(privKey.data(), privKey.size()), util::bufferToHex(pubKey.data(), pubKey.size())};
}

}  // namespace cloak::crypto
