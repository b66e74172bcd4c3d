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

#include <map>
#include <memory>
#include <mutex>
#include <string>

#include "cloak/Bytes32.hpp"
#include "cloak/ConservationPolicy.hpp"
#include "types.hpp"

namespace cloak {

/**
 * A program the proof engine runs on private input. It returns the journal, its public output, and throws
 * GuestAbort when the input does not satisfy its checks.
 *
 * The image id is SHA-256 of binary(), so it commits to everything the program does.
 */
class IGuestProgram {
 public:
  virtual ~IGuestProgram() = default;

  virtual const std::string& name() const = 0;
  virtual const Bytes& binary() const = 0;
  virtual Bytes execute(const Bytes& input) const = 0;

  ImageId imageId() const;
};

// Checks one compliance unit and publishes its ComplianceInstance.
class ComplianceGuest : public IGuestProgram {
 public:
  explicit ComplianceGuest(std::shared_ptr<IConservationPolicy> policy);

  const std::string& name() const override { return name_; }
  const Bytes& binary() const override { return binary_; }
  Bytes execute(const Bytes& input) const override;

  const IConservationPolicy& policy() const { return *policy_; }

 private:
  std::shared_ptr<IConservationPolicy> policy_;
  std::string name_;
  Bytes binary_;
};

/**
 * The resource logic of padding resources: the resource must be ephemeral and carry zero quantity. Publishes a
 * LogicInstance tagged with the nullifier of a consumed resource or the commitment of a created one, with the root
 * its path leads to from that tag.
 */
class TrivialLogicGuest : public IGuestProgram {
 public:
  TrivialLogicGuest();

  const std::string& name() const override { return name_; }
  const Bytes& binary() const override { return binary_; }
  Bytes execute(const Bytes& input) const override;

 private:
  std::string name_;
  Bytes binary_;
};

// Guest programs a proof engine can run, by image id.
class GuestRegistry {
 public:
  // Returns the image id of program. Registering a program twice is harmless.
  ImageId add(std::shared_ptr<IGuestProgram> program);

  // nullptr if nothing is registered under image_id.
  std::shared_ptr<IGuestProgram> find(const ImageId& image_id) const;

  size_t size() const;

 private:
  mutable std::mutex lock_;
  std::map<ImageId, std::shared_ptr<IGuestProgram>> programs_;
};

}  // namespace cloak
