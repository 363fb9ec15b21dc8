#pragma once

#include <stdexcept>
#include <string>

namespace permit::util {

/*
  Central error types.

  Thrown on the client's own write path. Authority outcomes are never
  thrown; they surface as decoded request status.
*/

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

// Request violates the targeting invariants. Raised before anything is persisted.
class MalformedRequest : public std::runtime_error {
 public:
  explicit MalformedRequest(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace permit::util
