#include "result.hpp"

#include <stdexcept>

#include "internal/util/errors.hpp"

namespace dbmgr::db {

const char* ToString(ErrorCode code) {
  switch (code) {
    case ErrorCode::OK:
      return "ok";
    case ErrorCode::NotFound:
      return "not found";
    case ErrorCode::Conflict:
      return "conflict";
    case ErrorCode::Busy:
      return "busy";
    case ErrorCode::ConstraintViolation:
      return "constraint violation";
    case ErrorCode::IOError:
      return "io error";
    case ErrorCode::Corruption:
      return "corruption";
    case ErrorCode::Unsupported:
      return "unsupported";
    case ErrorCode::InternalError:
      return "internal error";
  }
  return "unknown";
}

void ThrowIfError(const Result& result, const std::string& context) {
  if (result) {
    return;
  }

  const auto message = result.message.empty() ? context : context + ": " + result.message;
  switch (result.code) {
    case ErrorCode::NotFound:
      throw util::InvalidArgument(message);
    case ErrorCode::Conflict:
      throw util::ConflictingRequirement(message);
    case ErrorCode::Unsupported:
      throw util::NotSupported(message);
    default:
      throw std::runtime_error(message + " (" + ToString(result.code) + ")");
  }
}

} // namespace dbmgr::db
