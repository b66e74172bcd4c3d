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

#include "cloak/ConservationPolicy.hpp"
#include "cloak/errors.hpp"

namespace cloak {

const std::string StrictQuantityConservation::kName = "strict-quantity";
const std::string DeltaBalancedConservation::kName = "delta-balanced";

std::optional<std::string> StrictQuantityConservation::check(const Resource& consumed,
                                                             const Resource& created) const {
  if (consumed.quantity() != created.quantity()) return "quantity mismatch";
  if (consumed.label() != created.label()) return "label mismatch";
  if (consumed.imageId() != created.imageId()) return "resource logic mismatch";
  return std::nullopt;
}

std::shared_ptr<IConservationPolicy> makeConservationPolicy(const std::string& name) {
  if (name == StrictQuantityConservation::kName) return std::make_shared<StrictQuantityConservation>();
  if (name == DeltaBalancedConservation::kName) return std::make_shared<DeltaBalancedConservation>();
  throw ConfigError("unknown conservation policy '" + name + "'");
}

}  // namespace cloak
