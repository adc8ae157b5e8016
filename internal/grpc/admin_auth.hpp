#pragma once

#include <string>

#include <grpcpp/grpcpp.h>

namespace sandbox::grpc {

inline constexpr const char* kAdminTokenMetadata = "x-sandbox-admin-token";

/*
  Guards administrative RPCs. With an empty token every caller is
  admitted; otherwise the request must carry the token in
  x-sandbox-admin-token metadata.
*/
class AdminAuth {
public:
  explicit AdminAuth(std::string token);

  bool Enabled() const {
    return !token_.empty();
  }

  // Throws util::PermissionDenied when the caller is not an admin.
  void Require(const ::grpc::ServerContext* context) const;

private:
  std::string token_;
};

} // namespace sandbox::grpc
