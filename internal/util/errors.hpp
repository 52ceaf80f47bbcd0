#pragma once

#include <stdexcept>
#include <string>

namespace medianode::util {

/*
  Central error types.

  These get translated later to gRPC status codes.
*/

class InvalidStateTransition : public std::runtime_error {
 public:
  explicit InvalidStateTransition(const std::string& msg) : std::runtime_error(msg) {
  }
};

class UsageUnderflow : public std::runtime_error {
 public:
  explicit UsageUnderflow(const std::string& msg) : std::runtime_error(msg) {
  }
};

class NodeNotFound : public std::runtime_error {
 public:
  explicit NodeNotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class AlreadyExists : public std::runtime_error {
 public:
  explicit AlreadyExists(const std::string& msg) : std::runtime_error(msg) {
  }
};

class ProvisioningFailure : public std::runtime_error {
 public:
  explicit ProvisioningFailure(const std::string& msg) : std::runtime_error(msg) {
  }
};

class Unavailable : public std::runtime_error {
 public:
  explicit Unavailable(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace medianode::util
