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

// Authenticated encryption of resource payloads between two X25519 key holders.
//
//   key        = SHA-256("cloak.aead.key" || X25519(sk, pk))
//   ciphertext = AES-256-GCM(key, nonce, message) || tag
//
// Sender and receiver derive the same key from their own secret key and the other side's public key.

#pragma once

#include <array>
#include <optional>

#include "cloak/Bytes32.hpp"
#include "cloak/Keys.hpp"
#include "cloak/Random.hpp"
#include "cloak/Resource.hpp"
#include "crypto/crypto.hpp"
#include "status.hpp"
#include "types.hpp"

namespace cloak {

using AeadNonce = std::array<Byte, crypto::AesGcmNonceByteSize>;

// Throws EncryptError if pk or sk is not 32 bytes, nonce is not 12 bytes, or the key agreement fails.
Bytes encrypt(const Bytes& message, const Bytes& pk, const Bytes& sk, const Bytes& nonce);

// Throws DecryptError if pk or sk is not 32 bytes or nonce is not 12 bytes. Returns AuthenticationFailure, leaving
// plaintext untouched, if the tag does not verify or the key agreement fails.
util::Status decrypt(const Bytes& cipher, const Bytes& pk, const Bytes& sk, const Bytes& nonce, Bytes& plaintext);

// An encoded resource encrypted for its receiver, with what the receiver needs to decrypt it.
struct ResourceCiphertext {
  Bytes32 sender_public_key;
  AeadNonce nonce{};
  Bytes ciphertext;

  Bytes encode() const;
  // Throws MalformedEncoding.
  static ResourceCiphertext decode(const Bytes& bytes);
};

// Encrypts resource under a fresh nonce drawn from rng.
ResourceCiphertext encryptResource(const Resource& resource,
                                   const Bytes32& receiver_public_key,
                                   const KeyPair& sender,
                                   IRandomSource& rng);

// On success resource holds the decrypted resource. Returns AuthenticationFailure for a ciphertext not meant for
// receiver_secret_key, and InvalidArgument if the authenticated payload is not a resource.
util::Status decryptResource(const ResourceCiphertext& ciphertext,
                             const Bytes32& receiver_secret_key,
                             std::optional<Resource>& resource);

}  // namespace cloak
