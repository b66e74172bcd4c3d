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

#pragma once

#include <array>
#include <cstdint>
#include <memory>
#include <string>
#include <type_traits>
#include <utility>

#include <openssl/evp.h>

#include "assertUtils.hpp"

namespace cloak {
namespace util {
namespace detail {

struct EVPMdContextDeleter {
  void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};

// A wrapper around an OpenSSL EVP digest. Digest failures inside OpenSSL are treated as broken invariants.
template <const EVP_MD* (*EVPMethod)(), size_t DIGEST_SIZE_IN_BYTES>
class EVPHash {
 public:
  static constexpr size_t SIZE_IN_BYTES = DIGEST_SIZE_IN_BYTES;
  typedef std::array<uint8_t, SIZE_IN_BYTES> Digest;

  EVPHash() noexcept : ctx_(EVP_MD_CTX_new()) { CloakAssert(ctx_ != nullptr); }

  EVPHash(EVPHash&&) noexcept = default;
  EVPHash& operator=(EVPHash&&) noexcept = default;
  EVPHash(const EVPHash&) = delete;
  EVPHash& operator=(const EVPHash&) = delete;

  // Hash a single buffer.
  Digest digest(const void* buf, size_t size) noexcept {
    init();
    update(buf, size);
    return finish();
  }

  // init(), update() and finish() compute a digest over several buffers.
  void init() noexcept {
    CloakAssert(!updating_);
    CloakAssertEQ(EVP_MD_CTX_reset(ctx_.get()), 1);
    CloakAssertEQ(EVP_DigestInit_ex(ctx_.get(), EVPMethod(), nullptr), 1);
    updating_ = true;
  }

  void update(const void* buf, size_t size) noexcept {
    CloakAssert(updating_);
    CloakAssertEQ(EVP_DigestUpdate(ctx_.get(), buf, size), 1);
  }

  // Any contiguous byte container: std::array<uint8_t, N>, std::vector<uint8_t>, std::string.
  template <typename Container, typename = std::enable_if_t<sizeof(typename Container::value_type) == 1>>
  void update(const Container& c) noexcept {
    update(c.data(), c.size());
  }

  void update(const char* str) noexcept { update(str, std::char_traits<char>::length(str)); }

  void update(bool flag) noexcept {
    const uint8_t b = flag ? 1 : 0;
    update(&b, 1);
  }

  Digest finish() noexcept {
    CloakAssert(updating_);
    Digest digest;
    unsigned int digest_len = 0;
    CloakAssertEQ(EVP_DigestFinal_ex(ctx_.get(), digest.data(), &digest_len), 1);
    CloakAssertEQ(digest_len, SIZE_IN_BYTES);
    updating_ = false;
    return digest;
  }

 private:
  std::unique_ptr<EVP_MD_CTX, EVPMdContextDeleter> ctx_;
  bool updating_ = false;
};

}  // namespace detail
}  // namespace util
}  // namespace cloak
