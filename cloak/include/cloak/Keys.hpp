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

#pragma once

#include "cloak/Bytes32.hpp"
#include "cloak/Random.hpp"

namespace cloak {

// X25519 key pair used to encrypt resource payloads.
struct KeyPair {
  Bytes32 secret_key;
  Bytes32 public_key;
};

// A fresh non-zero nullifier key.
NullifierKey generateNsk(IRandomSource& rng);

// The public commitment to a nullifier key that resources carry: SHA-256("cloak.nullifier-key.commitment" || nsk).
NullifierKeyCommitment commitNullifierKey(const NullifierKey& nsk);

KeyPair generateKeyPair(IRandomSource& rng);

// X25519 public key for a secret key. Throws EncryptError if OpenSSL rejects the key.
Bytes32 derivePublicKey(const Bytes32& secret_key);

}  // namespace cloak
