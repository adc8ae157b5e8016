#include "admin_auth.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace sandbox::grpc {

namespace {

// Compares without an early exit on the first differing byte.
bool TokensEqual(const std::string& expected, const std::string& presented) {
  if (expected.size() != presented.size()) {
    return false;
  }
  unsigned char diff = 0;
  for (std::size_t i = 0; i < expected.size(); ++i) {
    diff |= static_cast<unsigned char>(expected[i] ^ presented[i]);
  }
  return diff == 0;
}

} // namespace

AdminAuth::AdminAuth(std::string token) : token_(std::move(token)) {
}

void AdminAuth::Require(const ::grpc::ServerContext* context) const {
  if (!Enabled()) {
    return;
  }

  const auto& metadata = context->client_metadata();
  const auto  it       = metadata.find(kAdminTokenMetadata);
  if (it == metadata.end()) {
    throw util::PermissionDenied("admin token required");
  }

  const std::string presented(it->second.data(), it->second.size());
  if (!TokensEqual(token_, presented)) {
    SANDBOX_LOG_WARN("Rejected admin request", {observability::StringField("peer", context->peer())});
    throw util::PermissionDenied("invalid admin token");
  }
}

} // namespace sandbox::grpc
