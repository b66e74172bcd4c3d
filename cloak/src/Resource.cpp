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

#include "cloak/Resource.hpp"
#include "cloak/Keys.hpp"
#include "cloak/errors.hpp"
#include "Logger.hpp"
#include "kvstream.h"
#include "sha_hash.hpp"

namespace cloak {

using util::sha256Of;

namespace {
const std::string kCommitmentDomain = "cloak.resource.commitment";
const std::string kNullifierDomain = "cloak.resource.nullifier";
}  // namespace

Resource::Resource(const ImageId& image_id,
                   const Bytes32& label,
                   const Bytes32& quantity,
                   const Bytes32& value,
                   bool ephemeral,
                   const Bytes32& nonce,
                   const NullifierKeyCommitment& npk,
                   const Bytes32& rand_seed)
    : image_id_{image_id},
      label_{label},
      quantity_{quantity},
      value_{value},
      ephemeral_{ephemeral},
      nonce_{nonce},
      npk_{npk},
      rand_seed_{rand_seed} {}

Bytes32 Resource::commitmentRandomness() const { return Bytes32{sha256Of(rand_seed_, "rcm", nonce_)}; }

Bytes32 Resource::nullifierRandomness() const { return Bytes32{sha256Of(rand_seed_, "psi", nonce_)}; }

Commitment Resource::commitment() const {
  return Bytes32{sha256Of(
      kCommitmentDomain, image_id_, label_, value_, npk_, nonce_, quantity_, ephemeral_, commitmentRandomness())};
}

Nullifier Resource::nullifier(const NullifierKey& nsk) const { return nullifierFromCommitment(nsk, commitment()); }

Nullifier Resource::nullifierFromCommitment(const NullifierKey& nsk, const Commitment& cm) const {
  if (commitNullifierKey(nsk) != npk_) throw NullifierKeyMismatch();
  return Bytes32{sha256Of(kNullifierDomain, nsk, nonce_, nullifierRandomness(), cm)};
}

bool Resource::operator==(const Resource& other) const {
  return image_id_ == other.image_id_ && label_ == other.label_ && quantity_ == other.quantity_ &&
         value_ == other.value_ && ephemeral_ == other.ephemeral_ && nonce_ == other.nonce_ && npk_ == other.npk_ &&
         rand_seed_ == other.rand_seed_;
}

void serialize(Bytes& output, const Resource& r) {
  serialize(output, r.imageId());
  serialize(output, r.label());
  serialize(output, r.quantity());
  serialize(output, r.value());
  wire::serialize(output, r.isEphemeral());
  serialize(output, r.nonce());
  serialize(output, r.npk());
  serialize(output, r.randSeed());
}

Resource deserializeResource(const uint8_t*& start, const uint8_t* end) {
  Bytes32 image_id, label, quantity, value, nonce, npk, rand_seed;
  bool ephemeral = false;
  deserialize(start, end, image_id);
  deserialize(start, end, label);
  deserialize(start, end, quantity);
  deserialize(start, end, value);
  wire::deserialize(start, end, ephemeral);
  deserialize(start, end, nonce);
  deserialize(start, end, npk);
  deserialize(start, end, rand_seed);
  return Resource{image_id, label, quantity, value, ephemeral, nonce, npk, rand_seed};
}

Bytes Resource::encode() const {
  Bytes out;
  out.reserve(kEncodedSize);
  serialize(out, *this);
  return out;
}

Resource Resource::decode(const Bytes& bytes) {
  if (bytes.size() != kEncodedSize) throw InvalidInputLength("resource", kEncodedSize, bytes.size());
  const uint8_t* start = bytes.data();
  try {
    return deserializeResource(start, bytes.data() + bytes.size());
  } catch (const wire::DeserializeError& e) {
    throw MalformedEncoding("resource", e.what());
  }
}

Resource generateResource(const Bytes32& label,
                          const Bytes32& nonce,
                          const Bytes32& quantity,
                          const Bytes32& value,
                          bool ephemeral,
                          const NullifierKey& nsk,
                          const ImageId& image_id,
                          const Bytes32& rand_seed) {
  Resource resource{image_id, label, quantity, value, ephemeral, nonce, commitNullifierKey(nsk), rand_seed};
  LOG_DEBUG(RESOURCE_LOG, "Generated resource" << KVLOG(image_id, label, ephemeral));
  return resource;
}

std::ostream& operator<<(std::ostream& os, const Resource& r) {
  return os << "Resource{image_id: " << r.imageId() << ", label: " << r.label() << ", quantity: " << r.quantity()
            << ", ephemeral: " << (r.isEphemeral() ? "true" : "false") << "}";
}

}  // namespace cloak
