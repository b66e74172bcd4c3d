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

#include <array>
#include <cstdint>
#include <cstring>
#include <iterator>
#include <stdexcept>
#include <string>

#include <boost/algorithm/hex.hpp>

// Fixed-size byte string. Its size is part of the type so a value of the wrong length cannot be constructed.
template <size_t ByteCount>
class SerializableByteArray {
 public:
  static constexpr const size_t ByteSize = ByteCount;
  using ByteArray = std::array<uint8_t, ByteSize>;
  using value_type = uint8_t;

  SerializableByteArray(const ByteArray& bytes) : bytes_(bytes) {}
  virtual ~SerializableByteArray() = default;

  const ByteArray& getBytes() const { return bytes_; }
  const uint8_t* data() const { return bytes_.data(); }
  static constexpr size_t size() { return ByteSize; }

  std::string toHexString() const {
    std::string ret;
    boost::algorithm::hex_lower(bytes_.begin(), bytes_.end(), std::back_inserter(ret));
    return ret;
  }

  std::string toString() const { return toHexString(); }

 protected:
  ByteArray bytes_;
};

// Throws std::invalid_argument for malformed hex or a decoded length other than ByteArrayClass::ByteSize.
template <typename ByteArrayClass>
static ByteArrayClass fromHexString(const std::string& hexString) {
  std::string keyBytes;
  try {
    keyBytes = boost::algorithm::unhex(hexString);
  } catch (const boost::algorithm::hex_decode_error&) {
    throw std::invalid_argument("malformed hex string");
  }
  if (keyBytes.size() != ByteArrayClass::ByteSize) {
    throw std::invalid_argument("expected " + std::to_string(ByteArrayClass::ByteSize) + " bytes, got " +
                                std::to_string(keyBytes.size()));
  }
  typename ByteArrayClass::ByteArray resultBytes;
  std::memcpy(resultBytes.data(), keyBytes.data(), keyBytes.size());
  return ByteArrayClass{resultBytes};
}
