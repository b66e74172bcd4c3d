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
// terms and conditions of the sub-component's license, as noted in the LICENSE
// file.

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>

namespace cloak::crypto {

static constexpr const size_t Ed25519PrivateKeyByteSize = 32UL;
static constexpr const size_t Ed25519PublicKeyByteSize = 32UL;
static constexpr const size_t Ed25519SignatureByteSize = 64UL;

static constexpr const size_t X25519PrivateKeyByteSize = 32UL;
static constexpr const size_t X25519PublicKeyByteSize = 32UL;

static constexpr const size_t Aes256KeyByteSize = 32UL;
static constexpr const size_t AesGcmNonceByteSize = 12UL;
static constexpr const size_t AesGcmTagByteSize = 16UL;

/**
 * @brief Generates an EdDSA (Ed25519) key pair.
 *
 * @return pair<string, string> Private-Public key pair, hex encoded.
 */
std::pair<std::string, std::string> generateEdDSAKeyPair();

}  // namespace cloak::crypto
