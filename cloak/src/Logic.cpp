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

#include "cloak/Logic.hpp"
#include "cloak/errors.hpp"
#include "Logger.hpp"
#include "kvstream.h"
#include "wire.hpp"

namespace cloak {

namespace {

void serialize(Bytes& output, const ExpirableBlob& b) {
  wire::serialize(output, b.blob);
  wire::serialize(output, b.deletion_criterion);
}

ExpirableBlob deserializeBlob(const uint8_t*& start, const uint8_t* end) {
  ExpirableBlob b;
  wire::deserialize(start, end, b.blob);
  wire::deserialize(start, end, b.deletion_criterion);
  return b;
}

}  // namespace

Bytes LogicInstance::encode() const {
  Bytes out;
  cloak::serialize(out, tag);
  wire::serialize(out, is_consumed);
  cloak::serialize(out, root);
  wire::serialize(out, cipher);
  wire::serializeLength(out, app_data.size());
  for (const auto& b : app_data) serialize(out, b);
  return out;
}

LogicInstance LogicInstance::decode(const Bytes& bytes) {
  const uint8_t* start = bytes.data();
  const uint8_t* end = bytes.data() + bytes.size();
  LogicInstance instance;
  try {
    cloak::deserialize(start, end, instance.tag);
    wire::deserialize(start, end, instance.is_consumed);
    cloak::deserialize(start, end, instance.root);
    wire::deserialize(start, end, instance.cipher);
    const auto count = wire::deserializeLength(start, end);
    for (uint32_t i = 0; i < count; i++) instance.app_data.push_back(deserializeBlob(start, end));
    wire::expectEnd(start, end);
  } catch (const wire::DeserializeError& e) {
    throw MalformedEncoding("logic instance", e.what());
  }
  return instance;
}

bool LogicInstance::operator==(const LogicInstance& other) const {
  return tag == other.tag && is_consumed == other.is_consumed && root == other.root && cipher == other.cipher &&
         app_data == other.app_data;
}

std::ostream& operator<<(std::ostream& os, const LogicInstance& instance) {
  os << KVLOG(instance.tag, instance.is_consumed, instance.root, instance.cipher.size(), instance.app_data.size());
  return os;
}

Bytes LogicWitness::encode() const {
  Bytes out;
  cloak::serialize(out, resource);
  cloak::serialize(out, path);
  wire::serialize(out, is_consumed);
  cloak::serialize(out, nsk);
  return out;
}

LogicWitness LogicWitness::decode(const Bytes& bytes) {
  const uint8_t* start = bytes.data();
  const uint8_t* end = bytes.data() + bytes.size();
  try {
    auto resource = deserializeResource(start, end);
    auto path = deserializeMerklePath(start, end);
    bool is_consumed = false;
    wire::deserialize(start, end, is_consumed);
    NullifierKey nsk;
    cloak::deserialize(start, end, nsk);
    wire::expectEnd(start, end);
    return LogicWitness{resource, path, is_consumed, nsk};
  } catch (const wire::DeserializeError& e) {
    throw MalformedEncoding("logic witness", e.what());
  }
}

Bytes generateLogicWitness(const Bytes& resource, const Bytes& path, const Bytes& nsk, bool is_consumed) {
  try {
    LogicWitness witness{
        Resource::decode(resource), MerklePath::decode(path), is_consumed, Bytes32::fromBuffer(nsk, "nsk")};
    LOG_DEBUG(LOGIC_LOG, "Logic witness assembled: " << KVLOG(witness.resource.commitment(), is_consumed));
    return witness.encode();
  } catch (const InputValidationError& e) {
    throw WitnessAssemblyError(e.what());
  }
}

}  // namespace cloak
