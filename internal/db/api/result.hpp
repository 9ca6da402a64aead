#pragma once

#include <stdexcept>
#include <string>

namespace keyshop::db {

/*
  Portable DB result codes.

  The repository layer must translate backend errors into these.
  Upper layers should never depend on pqxx/sqlite error types.
*/

enum class ErrorCode {
  OK = 0,

  NotFound,
  AlreadyExists,
  Conflict,
  Busy,

  ConstraintViolation,
  SerializationFailure,

  IOError,
  Corruption,

  Unsupported,
  InternalError
};

const char* ToString(ErrorCode code);

struct Result {
  ErrorCode   code = ErrorCode::OK;
  std::string message;

  static Result Ok() {
    return {};
  }

  static Result Err(ErrorCode c, std::string msg = {}) {
    return {c, std::move(msg)};
  }

  explicit operator bool() const {
    return code == ErrorCode::OK;
  }
};

/*
  Storage fault.

  Thrown by backends for anything that is not an expected business outcome
  (lock contention, I/O, broken SQL). Carries the portable code so retry
  loops can tell transient faults from permanent ones.
*/
class DatabaseError : public std::runtime_error {
 public:
  DatabaseError(ErrorCode code, const std::string& msg) : std::runtime_error(msg), code_(code) {
  }

  ErrorCode code() const {
    return code_;
  }

  bool retryable() const {
    return code_ == ErrorCode::Busy || code_ == ErrorCode::SerializationFailure;
  }

 private:
  ErrorCode code_;
};

} // namespace keyshop::db
