#pragma once

#include <string>

namespace offline::db {

/*
  Portable storage result codes.

  Backends translate their native errors into these.
  Upper layers should never depend on sqlite error types.
*/

enum class ErrorCode {
  OK = 0,

  NotFound,
  Busy,
  ConstraintViolation,
  QuotaExceeded,

  IOError,
  Corruption,

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

// Throws util::StorageError carrying `what` and the result message when `r` is an error.
void ThrowIfError(const Result& r, const std::string& what);

} // namespace offline::db
