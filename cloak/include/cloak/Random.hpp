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

#include <cstdint>
#include <mutex>

#include "cloak/Bytes32.hpp"

namespace cloak {

// Source of secret randomness. Components that need randomness take one by reference. Implementations must be
// safe to call from several threads at once.
class IRandomSource {
 public:
  virtual ~IRandomSource() = default;

  // Fills out[0, len). Throws GeneratorFailure if no secure bytes can be produced.
  virtual void fill(Byte* out, size_t len) = 0;

  Bytes32 random32() {
    Bytes32::ByteArray raw;
    fill(raw.data(), raw.size());
    return Bytes32{raw};
  }
};

// OpenSSL's private DRBG, seeded from the operating system.
class SystemRandomSource : public IRandomSource {
 public:
  void fill(Byte* out, size_t len) override;
};

// Deterministic generator for reproducible test vectors: block i is SHA-256(seed || i), i as a big-endian uint64.
// Never use it for real keys.
class SeededRandomSource : public IRandomSource {
 public:
  explicit SeededRandomSource(const Bytes32& seed) : seed_{seed} {}
  explicit SeededRandomSource(uint64_t seed);

  void fill(Byte* out, size_t len) override;

 private:
  std::mutex lock_;
  const Bytes32 seed_;
  uint64_t counter_ = 0;
};

// The process-wide SystemRandomSource.
IRandomSource& systemRandom();

}  // namespace cloak
