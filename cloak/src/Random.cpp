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

#include "cloak/Random.hpp"
#include "cloak/errors.hpp"
#include "Logger.hpp"
#include "crypto/openssl/crypto.hpp"
#include "sha_hash.hpp"
#include "wire.hpp"

#include <openssl/rand.h>

#include <algorithm>
#include <climits>

namespace cloak {

using crypto::openssl::OPENSSL_SUCCESS;

void SystemRandomSource::fill(Byte* out, size_t len) {
  // RAND_priv_bytes takes an int length.
  while (len > 0) {
    const size_t chunk = std::min<size_t>(len, INT_MAX);
    if (RAND_priv_bytes(out, static_cast<int>(chunk)) != OPENSSL_SUCCESS) {
      const auto reason = crypto::openssl::lastOpenSSLError();
      LOG_ERROR(CLOAK_LOG, "RAND_priv_bytes failed: " << reason);
      throw GeneratorFailure(reason);
    }
    out += chunk;
    len -= chunk;
  }
}

SeededRandomSource::SeededRandomSource(uint64_t seed) : seed_{[seed]() {
  Bytes encoded;
  wire::serialize(encoded, seed);
  return Bytes32{util::sha256Of(std::string("cloak.seeded-random"), encoded)};
}()} {}

void SeededRandomSource::fill(Byte* out, size_t len) {
  std::lock_guard<std::mutex> g(lock_);
  while (len > 0) {
    Bytes counter;
    wire::serialize(counter, counter_++);
    const auto block = util::sha256Of(seed_, counter);
    const size_t n = std::min(len, block.size());
    std::copy_n(block.begin(), n, out);
    out += n;
    len -= n;
  }
}

IRandomSource& systemRandom() {
  static SystemRandomSource source;
  return source;
}

}  // namespace cloak
