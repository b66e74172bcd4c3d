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

#include "types.hpp"

namespace cloak {

// Output of a proof: the seal attests that some guest program produced journal.
struct Receipt {
  Bytes seal;
  Bytes journal;

  // Length-prefixed seal followed by the length-prefixed journal.
  Bytes encode() const;
  // Throws VerifyError for a malformed encoding.
  static Receipt decode(const Bytes& bytes);

  bool operator==(const Receipt& other) const { return seal == other.seal && journal == other.journal; }
};

}  // namespace cloak
