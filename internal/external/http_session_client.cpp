#include "http_session_client.hpp"

#include <stdexcept>

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>

#include "config/config.pb.h"
#include "internal/external/http_client.hpp"
#include "internal/observability/logging.hpp"

namespace sandbox::external {

HttpSessionOptions HttpSessionOptions::FromConfig(const sandbox::runtime::config::RuntimeConfig& config) {
  HttpSessionOptions options;
  if (!config.presence().preview_host().empty()) options.host = config.presence().preview_host();
  if (!config.containers().session_path().empty()) options.path = config.containers().session_path();
  if (config.containers().session_timeout_ms() > 0) {
    options.timeout = std::chrono::milliseconds(config.containers().session_timeout_ms());
  }
  return options;
}

namespace {

std::string SessionBody(const std::string& title) {
  google::protobuf::Struct body;
  (*body.mutable_fields())["title"].set_string_value(title);

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(body, &json);
  if (!status.ok()) {
    throw std::runtime_error("cannot encode session request: " + std::string(status.message()));
  }
  return json;
}

} // namespace

HttpSessionClient::HttpSessionClient(HttpSessionOptions options) : options_(std::move(options)) {
}

void HttpSessionClient::CreateSession(const db::model::ProjectRecord& project) {
  if (project.runtime_port == 0) {
    throw std::runtime_error("project " + project.id + " has no runtime port");
  }

  HttpRequest request;
  request.method  = "POST";
  request.host    = options_.host;
  request.port    = project.runtime_port;
  request.path    = options_.path;
  request.body    = SessionBody(project.id);
  request.timeout = options_.timeout;

  const auto response = SendHttpRequest(request);
  if (response.status < 200 || response.status >= 300) {
    throw std::runtime_error("session create returned HTTP " + std::to_string(response.status));
  }

  SANDBOX_LOG_INFO("runtime session created", {observability::StringField("project_id", project.id),
                                                observability::IntField("port", project.runtime_port)});
}

} // namespace sandbox::external
