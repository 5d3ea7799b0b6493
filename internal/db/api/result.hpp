#pragma once

#include <string>

namespace dbmgr::db {

/*
  Portable DB result codes.

  Drivers translate backend errors into these.
  Upper layers never depend on pqxx/sqlite error types.
*/

enum class ErrorCode {
  OK = 0,

  NotFound,
  Conflict,
  Busy,

  ConstraintViolation,

  IOError,
  Corruption,

  Unsupported,
  InternalError
};

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

const char* ToString(ErrorCode code);

// Converts a failed Result into the matching util:: exception.
void ThrowIfError(const Result& result, const std::string& context);

} // namespace dbmgr::db
