// Copyright 2024 VMware, all rights reserved

/**
 * Status stores the result of an operation whose failure is an expected outcome rather than an error, such as an
 * authentication tag that does not verify.
 */

#pragma once

#include <ostream>
#include <string>

namespace cloak::util {

class Status {
 public:
  static Status OK() { return Status(ok, ""); }
  static Status InvalidArgument(const std::string& msg) { return Status(invalidArgument, msg); }
  static Status AuthenticationFailure(const std::string& msg) { return Status(authenticationFailure, msg); }
  static Status GeneralError(const std::string& msg) { return Status(generalError, msg); }

  bool isOK() const { return type == ok; }
  bool isInvalidArgument() const { return type == invalidArgument; }
  bool isAuthenticationFailure() const { return type == authenticationFailure; }
  bool isGeneralError() const { return type == generalError; }

  std::string toString() const { return messagePrefix() + (!isOK() ? message : std::string("")); }

  bool operator==(const Status& status) const { return type == status.type; };
  bool operator!=(const Status& status) const { return type != status.type; };

 private:
  enum statusType { ok, invalidArgument, authenticationFailure, generalError };

  statusType type;
  std::string message;

  Status(statusType t, const std::string& msg) : type(t), message(msg) {}

  std::string messagePrefix() const {
    switch (type) {
      case ok:
        return "OK";
      case invalidArgument:
        return "Invalid Argument: ";
      case authenticationFailure:
        return "Authentication Failure: ";
      case generalError:
        return "General Error: ";
    }
    return "Unknown Error Type: ";
  }
};

std::ostream& operator<<(std::ostream& s, Status const& status);

}  // namespace cloak::util
