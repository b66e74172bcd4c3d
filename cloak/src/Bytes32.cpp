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

#include "cloak/Bytes32.hpp"
#include "cloak/errors.hpp"

#include <cstring>

namespace cloak {

Bytes32 Bytes32::fromBuffer(const Byte* data, size_t len, const std::string& field) {
  if (len != ByteSize) throw InvalidInputLength(field, ByteSize, len);
  ByteArray raw;
  std::memcpy(raw.data(), data, ByteSize);
  return Bytes32{raw};
}

}  // namespace cloak
