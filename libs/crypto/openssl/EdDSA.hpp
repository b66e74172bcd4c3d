// Cloak
//
// Copyright (c) 2024 VMware, Inc. All Rights Reserved.
//
// This product is licensed to you under the Apache 2.0 license (the "License").
// You may not use this product except in compliance with the Apache 2.0 License.
//
// This product may include a number of subcomponents with separate copyright
// notices and license terms. Your use of these subcomponents is subject to the
// terms and conditions of the subcomponent's license, as noted in the
// LICENSE file.
//
#pragma once

#include "crypto/crypto.hpp"
#include "SerializableByteArray.hpp"
#include "crypto.hpp"

namespace cloak::crypto::openssl {

class EdDSAPrivateKey : public SerializableByteArray<Ed25519PrivateKeyByteSize> {
 public:
  EdDSAPrivateKey(const EdDSAPrivateKey::ByteArray& arr) : SerializableByteArray<Ed25519PrivateKeyByteSize>(arr) {}
};

class EdDSAPublicKey : public SerializableByteArray<Ed25519PublicKeyByteSize> {
 public:
  EdDSAPublicKey(const EdDSAPublicKey::ByteArray& arr) : SerializableByteArray<Ed25519PublicKeyByteSize>(arr) {}
};

// The public key matching privateKey. Throws OpenSSLError if OpenSSL rejects the key.
EdDSAPublicKey deriveEdDSAPublicKey(const EdDSAPrivateKey& privateKey);

}  // namespace cloak::crypto::openssl
