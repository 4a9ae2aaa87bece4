#pragma once

#include <cstdint>
#include <string>

namespace jobq::db {

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

  // Rows touched by the statement. Conditional updates report 0 when their
  // guard did not match.
  uint64_t rows_affected = 0;

  static Result Ok(uint64_t rows = 0) {
    return {ErrorCode::OK, {}, rows};
  }

  static Result Err(ErrorCode c, std::string msg = {}) {
    return {c, std::move(msg), 0};
  }

  explicit operator bool() const {
    return code == ErrorCode::OK;
  }
};

} // namespace jobq::db
