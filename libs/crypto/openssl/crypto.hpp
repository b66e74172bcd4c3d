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
//
// Thin wrapper over the parts of OpenSSL's libcrypto cloak relies on. OpenSSL objects are held in unique_ptrs with
// the matching free function, and failures reported by OpenSSL are raised as OpenSSLError.
#pragma once

#include <climits>
#include <memory>
#include <stdexcept>
#include <string>
#include "crypto/crypto.hpp"

#include "assertUtils.hpp"

// OpenSSL includes.
#include <openssl/bn.h>
#include <openssl/crypto.h>
#include <openssl/ec.h>
#include <openssl/err.h>
#include <openssl/evp.h>

template <auto delete_function>
struct deleter_from_fn {
  template <typename T>
  constexpr void operator()(T* arg) const {
    delete_function(arg);
  }
};

template <typename T, auto fn>
using custom_deleter_unique_ptr = std::unique_ptr<T, deleter_from_fn<fn>>;

namespace cloak::crypto::openssl {

using UniqueContext = custom_deleter_unique_ptr<EVP_MD_CTX, EVP_MD_CTX_free>;
using UniquePKEYContext = custom_deleter_unique_ptr<EVP_PKEY_CTX, EVP_PKEY_CTX_free>;
using UniquePKEY = custom_deleter_unique_ptr<EVP_PKEY, EVP_PKEY_free>;
using UniqueCipherContext = custom_deleter_unique_ptr<EVP_CIPHER_CTX, EVP_CIPHER_CTX_free>;
using UniqueBIGNUM = custom_deleter_unique_ptr<BIGNUM, BN_clear_free>;
using UniqueBNCTX = custom_deleter_unique_ptr<BN_CTX, BN_CTX_free>;
using UniqueECGROUP = custom_deleter_unique_ptr<EC_GROUP, EC_GROUP_free>;
using UniqueECPOINT = custom_deleter_unique_ptr<EC_POINT, EC_POINT_clear_free>;

constexpr int OPENSSL_SUCCESS = 1;
constexpr int OPENSSL_FAILURE = 0;
constexpr int OPENSSL_ERROR = -1;

static_assert(CHAR_BIT == 8);

// Raised when a call into OpenSSL unexpectedly reports a failure.
class OpenSSLError : public std::exception {
 private:
  std::string message;

 public:
  explicit OpenSSLError(const std::string& what) : message(what) {}
  virtual const char* what() const noexcept override { return message.c_str(); }
};

// Throws OpenSSLError carrying msg and the most recent OpenSSL error string when expr is false.
void OpenSSLAssert(bool expr, const std::string& msg);

// Pops and formats the oldest entry of the thread's OpenSSL error queue, then clears the queue.
std::string lastOpenSSLError();

// Drops pending entries of the thread's OpenSSL error queue after an expected failure.
inline void clearOpenSSLErrors() { ERR_clear_error(); }

}  // namespace cloak::crypto::openssl
