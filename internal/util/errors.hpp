#pragma once

#include <stdexcept>
#include <string>

namespace release::util {

/*
  Central error types.

  These get translated later to gRPC status codes.
*/

// Malformed release request: graph errors, bad environment. Raised before any side effect.
class ValidationError : public std::runtime_error {
 public:
  explicit ValidationError(const std::string& msg) : std::runtime_error(msg) {
  }
};

// One service's deploy or rollback failed or timed out.
class DeploymentError : public std::runtime_error {
 public:
  explicit DeploymentError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class RegistryError : public std::runtime_error {
 public:
  explicit RegistryError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class AlreadyExists : public std::runtime_error {
 public:
  explicit AlreadyExists(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidState : public std::runtime_error {
 public:
  explicit InvalidState(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace release::util
