#include "result.hpp"

#include "internal/util/errors.hpp"

namespace offline::db {

const char* ToString(ErrorCode code) {
  switch (code) {
    case ErrorCode::OK:
      return "ok";
    case ErrorCode::NotFound:
      return "not_found";
    case ErrorCode::Busy:
      return "busy";
    case ErrorCode::ConstraintViolation:
      return "constraint_violation";
    case ErrorCode::QuotaExceeded:
      return "quota_exceeded";
    case ErrorCode::IOError:
      return "io_error";
    case ErrorCode::Corruption:
      return "corruption";
    case ErrorCode::InternalError:
      return "internal_error";
  }
  return "unknown";
}

void ThrowIfError(const Result& r, const std::string& what) {
  if (r) return;
  throw offline::util::StorageError(what + " (" + ToString(r.code) + "): " + r.message);
}

} // namespace offline::db
