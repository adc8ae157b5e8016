#pragma once

#include <string>

#include "internal/db/api/result.hpp"
#include "internal/util/errors.hpp"

namespace sandbox::db {

// Maps a failed repository write onto the domain exception types.
inline void ThrowIfDbError(const Result& result, const std::string& context) {
  if (result) {
    return;
  }

  const auto message = result.message.empty() ? context : context + ": " + result.message;
  switch (result.code) {
    case ErrorCode::AlreadyExists:
      throw sandbox::util::AlreadyExists(message);
    case ErrorCode::NotFound:
      throw sandbox::util::NotFound(message);
    case ErrorCode::Conflict:
      throw sandbox::util::InvalidState(message);
    default:
      throw sandbox::util::StorageError(message + " [" + std::string(ToString(result.code)) + "]",
                                        IsTransient(result.code));
  }
}

} // namespace sandbox::db
