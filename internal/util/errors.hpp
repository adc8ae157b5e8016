#pragma once

#include <stdexcept>
#include <string>

namespace sandbox::util {

/*
  Central error types.

  Precondition failures surface synchronously to the caller and are
  translated to gRPC status codes at the transport edge.
*/

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class AlreadyExists : public std::runtime_error {
 public:
  explicit AlreadyExists(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Wrong state for the requested transition.
class InvalidState : public std::runtime_error {
 public:
  explicit InvalidState(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidArgument : public std::runtime_error {
 public:
  explicit InvalidArgument(const std::string& msg) : std::runtime_error(msg) {
  }
};

class PermissionDenied : public std::runtime_error {
 public:
  explicit PermissionDenied(const std::string& msg) : std::runtime_error(msg) {
  }
};

class ResourceExhausted : public std::runtime_error {
 public:
  explicit ResourceExhausted(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Backend write failed for a reason other than a precondition.
// Transient failures (lock contention, serialization) may succeed on retry.
class StorageError : public std::runtime_error {
 public:
  explicit StorageError(const std::string& msg, bool transient = false)
      : std::runtime_error(msg), transient_(transient) {
  }

  bool transient() const noexcept {
    return transient_;
  }

 private:
  bool transient_;
};

} // namespace sandbox::util
