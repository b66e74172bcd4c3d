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

#include "cloak/Encryption.hpp"
#include "cloak/errors.hpp"
#include "assertUtils.hpp"
#include "crypto/openssl/crypto.hpp"
#include "Logger.hpp"
#include "kvstream.h"
#include "sha_hash.hpp"
#include "wire.hpp"

#include <climits>

namespace cloak {

using namespace crypto::openssl;
using crypto::AesGcmNonceByteSize;
using crypto::AesGcmTagByteSize;
using crypto::X25519PrivateKeyByteSize;
using crypto::X25519PublicKeyByteSize;
using util::Status;

namespace {

const std::string kAeadKeyDomain = "cloak.aead.key";

// SHA-256(domain || X25519(sk, pk)), or nullopt if the agreement fails, e.g. for a small-order public key.
std::optional<Bytes32> agreeKey(const Bytes& pk, const Bytes& sk) {
  UniquePKEY priv{EVP_PKEY_new_raw_private_key(EVP_PKEY_X25519, nullptr, sk.data(), sk.size())};
  UniquePKEY peer{EVP_PKEY_new_raw_public_key(EVP_PKEY_X25519, nullptr, pk.data(), pk.size())};
  if (!priv || !peer) {
    LOG_WARN(ENCRYPTION_LOG, "X25519 key rejected: " << lastOpenSSLError());
    return std::nullopt;
  }
  UniquePKEYContext ctx{EVP_PKEY_CTX_new(priv.get(), nullptr)};
  OpenSSLAssert(ctx != nullptr, "EVP_PKEY_CTX_new failed");
  OpenSSLAssert(EVP_PKEY_derive_init(ctx.get()) == OPENSSL_SUCCESS, "EVP_PKEY_derive_init failed");
  if (EVP_PKEY_derive_set_peer(ctx.get(), peer.get()) != OPENSSL_SUCCESS) {
    LOG_WARN(ENCRYPTION_LOG, "X25519 peer rejected: " << lastOpenSSLError());
    return std::nullopt;
  }
  std::array<Byte, 32> shared{};
  size_t len = shared.size();
  if (EVP_PKEY_derive(ctx.get(), shared.data(), &len) != OPENSSL_SUCCESS || len != shared.size()) {
    LOG_WARN(ENCRYPTION_LOG, "X25519 agreement failed: " << lastOpenSSLError());
    OPENSSL_cleanse(shared.data(), shared.size());
    return std::nullopt;
  }
  Bytes32 key{util::sha256Of(kAeadKeyDomain, shared)};
  OPENSSL_cleanse(shared.data(), shared.size());
  return key;
}

template <typename Error>
void checkLengths(const Bytes& pk, const Bytes& sk, const Bytes& nonce) {
  if (pk.size() != X25519PublicKeyByteSize) throw Error("public key must be 32 bytes");
  if (sk.size() != X25519PrivateKeyByteSize) throw Error("secret key must be 32 bytes");
  if (nonce.size() != AesGcmNonceByteSize) throw Error("nonce must be 12 bytes");
}

UniqueCipherContext newCipherContext() {
  UniqueCipherContext ctx{EVP_CIPHER_CTX_new()};
  OpenSSLAssert(ctx != nullptr, "EVP_CIPHER_CTX_new failed");
  return ctx;
}

int toInt(size_t len) {
  if (len > static_cast<size_t>(INT_MAX)) throw InputValidationError("message too long");
  return static_cast<int>(len);
}

}  // namespace

Bytes encrypt(const Bytes& message, const Bytes& pk, const Bytes& sk, const Bytes& nonce) {
  checkLengths<EncryptError>(pk, sk, nonce);
  const auto key = agreeKey(pk, sk);
  if (!key) throw EncryptError("key agreement failed");

  auto ctx = newCipherContext();
  OpenSSLAssert(EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, key->data(), nonce.data()) ==
                    OPENSSL_SUCCESS,
                "EVP_EncryptInit_ex failed");
  Bytes out(message.size() + AesGcmTagByteSize);
  int len = 0;
  size_t written = 0;
  if (!message.empty()) {
    OpenSSLAssert(EVP_EncryptUpdate(ctx.get(), out.data(), &len, message.data(), toInt(message.size())) ==
                      OPENSSL_SUCCESS,
                  "EVP_EncryptUpdate failed");
    written = static_cast<size_t>(len);
  }
  OpenSSLAssert(EVP_EncryptFinal_ex(ctx.get(), out.data() + written, &len) == OPENSSL_SUCCESS,
                "EVP_EncryptFinal_ex failed");
  written += static_cast<size_t>(len);
  CloakAssertEQ(written, message.size());
  OpenSSLAssert(EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG, AesGcmTagByteSize, out.data() + written) ==
                    OPENSSL_SUCCESS,
                "failed to read the GCM tag");
  LOG_TRACE(ENCRYPTION_LOG, KVLOG(message.size(), out.size()));
  return out;
}

Status decrypt(const Bytes& cipher, const Bytes& pk, const Bytes& sk, const Bytes& nonce, Bytes& plaintext) {
  checkLengths<DecryptError>(pk, sk, nonce);
  if (cipher.size() < AesGcmTagByteSize) return Status::AuthenticationFailure("ciphertext shorter than the tag");
  const auto key = agreeKey(pk, sk);
  if (!key) return Status::AuthenticationFailure("key agreement failed");

  const size_t body = cipher.size() - AesGcmTagByteSize;
  auto ctx = newCipherContext();
  OpenSSLAssert(EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, key->data(), nonce.data()) ==
                    OPENSSL_SUCCESS,
                "EVP_DecryptInit_ex failed");
  Bytes out(body);
  int len = 0;
  size_t written = 0;
  // A null output buffer would make GCM treat the input as AAD.
  if (body > 0) {
    OpenSSLAssert(EVP_DecryptUpdate(ctx.get(), out.data(), &len, cipher.data(), toInt(body)) == OPENSSL_SUCCESS,
                  "EVP_DecryptUpdate failed");
    written = static_cast<size_t>(len);
  }
  Bytes tag(cipher.begin() + body, cipher.end());
  OpenSSLAssert(EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG, AesGcmTagByteSize, tag.data()) ==
                    OPENSSL_SUCCESS,
                "failed to set the GCM tag");
  if (EVP_DecryptFinal_ex(ctx.get(), out.data() + written, &len) != OPENSSL_SUCCESS) {
    clearOpenSSLErrors();
    OPENSSL_cleanse(out.data(), out.size());
    LOG_DEBUG(ENCRYPTION_LOG, "Tag mismatch: " << KVLOG(cipher.size()));
    return Status::AuthenticationFailure("tag mismatch");
  }
  written += static_cast<size_t>(len);
  CloakAssertEQ(written, body);
  plaintext = std::move(out);
  return Status::OK();
}

Bytes ResourceCiphertext::encode() const {
  Bytes out;
  serialize(out, sender_public_key);
  wire::serialize(out, nonce);
  wire::serialize(out, ciphertext);
  return out;
}

ResourceCiphertext ResourceCiphertext::decode(const Bytes& bytes) {
  const uint8_t* start = bytes.data();
  const uint8_t* end = bytes.data() + bytes.size();
  ResourceCiphertext rc;
  try {
    deserialize(start, end, rc.sender_public_key);
    wire::deserialize(start, end, rc.nonce);
    wire::deserialize(start, end, rc.ciphertext);
    wire::expectEnd(start, end);
  } catch (const wire::DeserializeError& e) {
    throw MalformedEncoding("resource ciphertext", e.what());
  }
  return rc;
}

ResourceCiphertext encryptResource(const Resource& resource,
                                   const Bytes32& receiver_public_key,
                                   const KeyPair& sender,
                                   IRandomSource& rng) {
  ResourceCiphertext rc;
  rc.sender_public_key = sender.public_key;
  rng.fill(rc.nonce.data(), rc.nonce.size());
  rc.ciphertext = encrypt(resource.encode(),
                          receiver_public_key.toBytes(),
                          sender.secret_key.toBytes(),
                          Bytes(rc.nonce.begin(), rc.nonce.end()));
  return rc;
}

Status decryptResource(const ResourceCiphertext& ciphertext,
                       const Bytes32& receiver_secret_key,
                       std::optional<Resource>& resource) {
  Bytes plaintext;
  auto status = decrypt(ciphertext.ciphertext,
                        ciphertext.sender_public_key.toBytes(),
                        receiver_secret_key.toBytes(),
                        Bytes(ciphertext.nonce.begin(), ciphertext.nonce.end()),
                        plaintext);
  if (!status.isOK()) return status;
  try {
    resource = Resource::decode(plaintext);
  } catch (const InputValidationError& e) {
    return Status::InvalidArgument(e.what());
  }
  return Status::OK();
}

}  // namespace cloak
