#include "grpc_error.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace sandbox::grpc {

namespace {

template <typename E>
bool Is(const std::exception& e) {
  return dynamic_cast<const E*>(&e) != nullptr;
}

::grpc::StatusCode CodeFor(const std::exception& e) {
  using namespace sandbox::util;

  if (Is<NotFound>(e)) return ::grpc::StatusCode::NOT_FOUND;
  if (Is<AlreadyExists>(e)) return ::grpc::StatusCode::ALREADY_EXISTS;
  if (Is<InvalidState>(e)) return ::grpc::StatusCode::FAILED_PRECONDITION;
  if (Is<InvalidArgument>(e)) return ::grpc::StatusCode::INVALID_ARGUMENT;
  if (Is<PermissionDenied>(e)) return ::grpc::StatusCode::PERMISSION_DENIED;
  if (Is<ResourceExhausted>(e)) return ::grpc::StatusCode::RESOURCE_EXHAUSTED;
  if (const auto* storage = dynamic_cast<const StorageError*>(&e)) {
    return storage->transient() ? ::grpc::StatusCode::UNAVAILABLE : ::grpc::StatusCode::INTERNAL;
  }
  return ::grpc::StatusCode::UNKNOWN;
}

} // namespace

::grpc::Status ToStatus(const std::exception& e) {
  auto code = CodeFor(e);
  if (code == ::grpc::StatusCode::UNKNOWN) {
    SANDBOX_LOG_ERROR("Unmapped exception at RPC boundary", {observability::StringField("error", e.what())});
    code = ::grpc::StatusCode::INTERNAL;
  }
  return {code, e.what()};
}

} // namespace sandbox::grpc
