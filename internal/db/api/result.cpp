#include "internal/db/api/result.hpp"

#include <stdexcept>

namespace modeldb::db {

const char* ErrorCodeName(ErrorCode code) {
  switch (code) {
    case ErrorCode::OK:
      return "ok";
    case ErrorCode::NotFound:
      return "not found";
    case ErrorCode::AlreadyExists:
      return "already exists";
    case ErrorCode::Busy:
      return "busy";
    case ErrorCode::ConstraintViolation:
      return "constraint violation";
    case ErrorCode::SerializationFailure:
      return "serialization failure";
    case ErrorCode::PermissionDenied:
      return "permission denied";
    case ErrorCode::InvalidName:
      return "invalid name";
    case ErrorCode::IOError:
      return "io error";
    case ErrorCode::Corruption:
      return "corruption";
    case ErrorCode::Unsupported:
      return "unsupported";
    case ErrorCode::InternalError:
      return "internal error";
  }
  return "internal error";
}

void ThrowIfDbError(const Result& result, const std::string& context) {
  if (result) {
    return;
  }

  std::string message = context + ": " + ErrorCodeName(result.code);
  if (!result.message.empty()) {
    message += ": " + result.message;
  }
  throw std::runtime_error(message);
}

} // namespace modeldb::db
