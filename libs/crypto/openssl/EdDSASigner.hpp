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

#include "EdDSA.hpp"
#include "crypto.hpp"
#include "crypto/signer.hpp"
#include "assertUtils.hpp"

namespace cloak::crypto::openssl {

/**
 * @tparam PrivateKeyType The type of the private key, expected to be a SerializableByteArray.
 */
template <typename PrivateKeyType>
class EdDSASigner : public ISigner {
 public:
  using SignerKeyType = PrivateKeyType;

  explicit EdDSASigner(const PrivateKeyType &privateKey) : privateKey_(privateKey) {}

  // signature must point to at least Ed25519SignatureByteSize bytes.
  size_t signBuffer(const Byte *msg, size_t len, Byte *signature) const override {
    UniquePKEY pkey(EVP_PKEY_new_raw_private_key(
        NID_ED25519, nullptr, privateKey_.getBytes().data(), privateKey_.getBytes().size()));
    OpenSSLAssert(pkey != nullptr, "failed to load Ed25519 private key");

    size_t signatureLength = Ed25519SignatureByteSize;
    UniqueContext ctx{EVP_MD_CTX_new()};
    OpenSSLAssert(ctx != nullptr, "failed to allocate a message digest context");
    OpenSSLAssert(EVP_DigestSignInit(ctx.get(), nullptr, nullptr, nullptr, pkey.get()) == OPENSSL_SUCCESS,
                  "EVP_DigestSignInit failed");
    OpenSSLAssert(EVP_DigestSign(ctx.get(), signature, &signatureLength, msg, len) == OPENSSL_SUCCESS,
                  "EVP_DigestSign failed");
    CloakAssertEQ(signatureLength, Ed25519SignatureByteSize);
    return signatureLength;
  }

  size_t signatureLength() const override { return Ed25519SignatureByteSize; }

  virtual ~EdDSASigner() = default;

 protected:
  const PrivateKeyType privateKey_;
};
}  // namespace cloak::crypto::openssl
