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

// Resource logic proofs: a logic guest proves a statement about one resource and publishes a LogicInstance that
// names the resource by its tag.

#pragma once

#include <cstdint>
#include <ostream>
#include <vector>

#include "cloak/Bytes32.hpp"
#include "cloak/MerklePath.hpp"
#include "cloak/Resource.hpp"
#include "types.hpp"

namespace cloak {

// Application data published by a logic guest, with a hint for when a node may drop it.
struct ExpirableBlob {
  Bytes blob;
  uint8_t deletion_criterion = 0;

  bool operator==(const ExpirableBlob& other) const {
    return blob == other.blob && deletion_criterion == other.deletion_criterion;
  }
};

/**
 * Public output of a logic guest. The tag is the nullifier of a consumed resource or the commitment of a created
 * one, and root is the root the tag's action path leads to.
 */
struct LogicInstance {
  Bytes32 tag;
  bool is_consumed = false;
  Bytes32 root;
  Bytes cipher;
  std::vector<ExpirableBlob> app_data;

  Bytes encode() const;
  // Throws MalformedEncoding.
  static LogicInstance decode(const Bytes& bytes);

  bool operator==(const LogicInstance& other) const;
  bool operator!=(const LogicInstance& other) const { return !(*this == other); }
};

std::ostream& operator<<(std::ostream& os, const LogicInstance& instance);

// Private input of a logic guest.
struct LogicWitness {
  Resource resource;
  MerklePath path;
  bool is_consumed = false;
  NullifierKey nsk;

  Bytes encode() const;
  // Throws MalformedEncoding.
  static LogicWitness decode(const Bytes& bytes);
};

// Byte level witness assembly for logic guests. A malformed or wrong-length input is a WitnessAssemblyError.
Bytes generateLogicWitness(const Bytes& resource, const Bytes& path, const Bytes& nsk, bool is_consumed);

}  // namespace cloak
