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

#include "cloak/Receipt.hpp"
#include "cloak/errors.hpp"
#include "wire.hpp"

namespace cloak {

Bytes Receipt::encode() const {
  Bytes out;
  wire::serialize(out, seal);
  wire::serialize(out, journal);
  return out;
}

Receipt Receipt::decode(const Bytes& bytes) {
  const uint8_t* start = bytes.data();
  const uint8_t* end = bytes.data() + bytes.size();
  Receipt receipt;
  try {
    wire::deserialize(start, end, receipt.seal);
    wire::deserialize(start, end, receipt.journal);
    wire::expectEnd(start, end);
  } catch (const wire::DeserializeError& e) {
    throw VerifyError(std::string{"malformed receipt: "} + e.what());
  }
  return receipt;
}

}  // namespace cloak
