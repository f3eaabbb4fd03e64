#pragma once

#include <stdexcept>
#include <string>

namespace modsync::util {

/*
  Central error types.

  Transport adapters translate gRPC status codes into these; the core
  decides per type whether a failure is isolated, reverted or degraded.
*/

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Archive unreadable, permission denied, service unreachable.
class TransportError : public std::runtime_error {
 public:
  explicit TransportError(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Malformed manifest or rejected request; surfaced verbatim, never retried.
class ValidationError : public std::runtime_error {
 public:
  explicit ValidationError(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Optional collaborator capability is not offered by the remote end.
class CapabilityUnavailable : public std::runtime_error {
 public:
  explicit CapabilityUnavailable(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Duplicate identity keys inside one registry snapshot.
class DataIntegrityError : public std::runtime_error {
 public:
  explicit DataIntegrityError(const std::string& msg) : std::runtime_error(msg) {
  }
};

// A record that mixes the flat and nested skin shapes.
class ContractViolation : public std::runtime_error {
 public:
  explicit ContractViolation(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace modsync::util
