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

#include <memory>
#include <optional>
#include <string>

#include "cloak/Resource.hpp"

namespace cloak {

// Rule a compliance unit enforces between the resource it consumes and the one it creates.
class IConservationPolicy {
 public:
  virtual ~IConservationPolicy() = default;

  // Stable name. It is part of the compliance guest image, so the image id commits to the policy.
  virtual const std::string& name() const = 0;

  // std::nullopt if the pair satisfies the rule, otherwise the reason it does not.
  virtual std::optional<std::string> check(const Resource& consumed, const Resource& created) const = 0;
};

// Equal quantity and equal kind (label and resource logic).
class StrictQuantityConservation : public IConservationPolicy {
 public:
  static const std::string kName;

  const std::string& name() const override { return kName; }
  std::optional<std::string> check(const Resource& consumed, const Resource& created) const override;
};

// No per-pair rule. Balance is established at transaction level from the published deltas.
class DeltaBalancedConservation : public IConservationPolicy {
 public:
  static const std::string kName;

  const std::string& name() const override { return kName; }
  std::optional<std::string> check(const Resource&, const Resource&) const override { return std::nullopt; }
};

// Throws ConfigError for an unknown name.
std::shared_ptr<IConservationPolicy> makeConservationPolicy(const std::string& name);

}  // namespace cloak
