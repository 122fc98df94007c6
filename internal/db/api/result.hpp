#pragma once

#include <string>

namespace modeldb::db {

/*
  Portable DB result codes.

  The store layer must translate backend errors into these.
  Upper layers should never depend on pqxx/sqlite error types.
*/

enum class ErrorCode {
  OK = 0,

  NotFound,
  AlreadyExists,
  Busy,

  ConstraintViolation,
  SerializationFailure,
  PermissionDenied,
  InvalidName,

  IOError,
  Corruption,

  Unsupported,
  InternalError
};

const char* ErrorCodeName(ErrorCode code);

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

// Throws std::runtime_error("<context>: <code>: <message>") when !result.
void ThrowIfDbError(const Result& result, const std::string& context);

} // namespace modeldb::db
