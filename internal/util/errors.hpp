#pragma once

#include <stdexcept>
#include <string>

namespace keyshop::util {

/*
  Central error types.

  These get translated later to gRPC status codes.
  Storage faults are db::DatabaseError, not one of these.
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

class InvalidArgument : public std::runtime_error {
 public:
  explicit InvalidArgument(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidState : public std::runtime_error {
 public:
  explicit InvalidState(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Provider notification failed verification.
class Rejected : public std::runtime_error {
 public:
  explicit Rejected(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace keyshop::util
