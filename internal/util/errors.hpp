#pragma once

#include <stdexcept>
#include <string>

namespace proxicloud::util {

/*
  Central error types.

  These get translated later to gRPC status codes.
*/

// Malformed or out-of-policy input (bad CIDR, gateway, container-ID range).
class ValidationError : public std::runtime_error {
 public:
  explicit ValidationError(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Duplicate name, overlapping range, VMID in use, project still has containers.
class Conflict : public std::runtime_error {
 public:
  explicit Conflict(const std::string& msg) : std::runtime_error(msg) {
  }
};

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

// A call to the hypervisor API failed.
class ProvisioningError : public std::runtime_error {
 public:
  explicit ProvisioningError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class PersistenceError : public std::runtime_error {
 public:
  explicit PersistenceError(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace proxicloud::util
