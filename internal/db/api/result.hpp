#pragma once

#include <string>
#include <string_view>

namespace sandbox::db {

/*
  Backend-neutral outcome of a repository write. SQLite and libpqxx
  errors are translated into these before leaving the db layer.

  Conflict is reserved for compare-and-set guards on job rows: the
  stored state or lock owner no longer matches what the caller read.
*/
enum class ErrorCode {
  OK = 0,

  NotFound,
  AlreadyExists,
  Conflict,
  // unique index on an active dedupe key
  ConstraintViolation,

  Busy,
  SerializationFailure,
  IOError,
  Corruption,
  InternalError
};

inline std::string_view ToString(ErrorCode code) {
  switch (code) {
    case ErrorCode::OK:
      return "ok";
    case ErrorCode::NotFound:
      return "not_found";
    case ErrorCode::AlreadyExists:
      return "already_exists";
    case ErrorCode::Conflict:
      return "conflict";
    case ErrorCode::ConstraintViolation:
      return "constraint_violation";
    case ErrorCode::Busy:
      return "busy";
    case ErrorCode::SerializationFailure:
      return "serialization_failure";
    case ErrorCode::IOError:
      return "io_error";
    case ErrorCode::Corruption:
      return "corruption";
    case ErrorCode::InternalError:
      return "internal_error";
  }
  return "unknown";
}

// Busy and serialization failures clear up when the transaction is retried.
inline bool IsTransient(ErrorCode code) {
  return code == ErrorCode::Busy || code == ErrorCode::SerializationFailure;
}

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

} // namespace sandbox::db
