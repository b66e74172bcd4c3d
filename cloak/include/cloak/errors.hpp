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
//
// Exceptions raised by the protocol. A rejected proof or a ciphertext whose tag does not verify is not an
// exception: verification returns false and decryption returns Status::AuthenticationFailure.

#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace cloak {

class CloakError : public std::runtime_error {
 public:
  explicit CloakError(const std::string& what) : std::runtime_error(what) {}
};

// Caller supplied bytes that are malformed or have the wrong size. Raised before any cryptographic work.
class InputValidationError : public CloakError {
 public:
  explicit InputValidationError(const std::string& what) : CloakError(what) {}
};

class InvalidInputLength : public InputValidationError {
 public:
  InvalidInputLength(const std::string& field, size_t expected, size_t actual)
      : InvalidInputLength(field, std::to_string(expected), actual) {}
  // expected describes the accepted sizes, e.g. "1057 or 1089".
  InvalidInputLength(const std::string& field, const std::string& expected, size_t actual)
      : InputValidationError("invalid length for " + field + ": expected " + expected + " bytes, got " +
                             std::to_string(actual)),
        field_{field} {}

  const std::string& field() const { return field_; }

 private:
  std::string field_;
};

// Bytes that have the right size but do not decode, e.g. a bool byte other than 0 or 1, or trailing data.
class MalformedEncoding : public InputValidationError {
 public:
  MalformedEncoding(const std::string& what, const std::string& reason)
      : InputValidationError("malformed " + what + ": " + reason) {}
};

class WitnessAssemblyError : public InputValidationError {
 public:
  explicit WitnessAssemblyError(const std::string& what) : InputValidationError("witness assembly: " + what) {}
};

class NullifierKeyMismatch : public InputValidationError {
 public:
  NullifierKeyMismatch() : InputValidationError("nullifier key does not match the resource's key commitment") {}
};

class EncryptError : public InputValidationError {
 public:
  explicit EncryptError(const std::string& what) : InputValidationError("encrypt: " + what) {}
};

class DecryptError : public InputValidationError {
 public:
  explicit DecryptError(const std::string& what) : InputValidationError("decrypt: " + what) {}
};

class TreeFull : public InputValidationError {
 public:
  TreeFull() : InputValidationError("commitment tree is full") {}
};

// A receipt that cannot be decoded. A well formed receipt that fails verification is not an error.
class VerifyError : public InputValidationError {
 public:
  explicit VerifyError(const std::string& what) : InputValidationError("verify: " + what) {}
};

// The proving backend failed: unknown or malformed guest program, or an internal backend error.
class ProofEngineFailure : public CloakError {
 public:
  explicit ProofEngineFailure(const std::string& what) : CloakError(what) {}
};

// The guest program rejected its input. This is how an invalid transfer surfaces at proving time.
class ProveError : public ProofEngineFailure {
 public:
  explicit ProveError(const std::string& what) : ProofEngineFailure("prove: " + what) {}
};

class ProveTimeout : public ProofEngineFailure {
 public:
  explicit ProveTimeout(const std::string& what) : ProofEngineFailure("prove timeout: " + what) {}
};

// Raised inside a guest program when one of its checks fails.
class GuestAbort : public CloakError {
 public:
  explicit GuestAbort(const std::string& what) : CloakError(what) {}
};

// The secure random source is unavailable. Never recovered by falling back to a weaker source.
class GeneratorFailure : public CloakError {
 public:
  explicit GeneratorFailure(const std::string& what) : CloakError("random generator failure: " + what) {}
};

class ConfigError : public CloakError {
 public:
  explicit ConfigError(const std::string& what) : CloakError("configuration: " + what) {}
};

}  // namespace cloak
