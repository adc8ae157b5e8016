#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <stdexcept>

namespace sandbox::config {

using sandbox::runtime::config::RuntimeConfig;

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

static void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  std::string scalar_value = node.Scalar();

  // Quoted scalars stay strings ("3000" for a string field).
  if (node.Tag() == "!") {
    value->set_string_value(scalar_value);
    return;
  }

  if (scalar_value == "true" || scalar_value == "false") {
    value->set_bool_value(scalar_value == "true");
    return;
  }

  char*        endptr        = nullptr;
  const double numeric_value = strtod(scalar_value.c_str(), &endptr);
  if (!scalar_value.empty() && endptr && *endptr == '\0') {
    value->set_number_value(numeric_value);
    return;
  }

  value->set_string_value(scalar_value);
}

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value) {
  switch (node.Type()) {
    case YAML::NodeType::Null:
      value->set_null_value(google::protobuf::NullValue::NULL_VALUE);
      break;

    case YAML::NodeType::Scalar:
      SetScalarValue(node, value);
      break;

    case YAML::NodeType::Sequence: {
      auto* list_value = value->mutable_list_value();
      for (size_t i = 0; i < node.size(); ++i) {
        YamlToProtoValue(node[i], list_value->add_values());
      }
      break;
    }

    case YAML::NodeType::Map: {
      auto* struct_value = value->mutable_struct_value();
      for (auto it : node) {
        YamlToProtoValue(it.second, &(*struct_value->mutable_fields())[it.first.Scalar()]);
      }
      break;
    }

    default:
      throw std::runtime_error("Unsupported YAML node");
  }
}

static RuntimeConfig ParseYaml(const YAML::Node& yaml) {
  RuntimeConfig config;

  // An empty document means "all defaults".
  if (yaml.IsNull()) {
    ConfigLoader::ApplyDefaults(&config);
    ConfigLoader::Validate(config);
    return config;
  }

  google::protobuf::Value json_value;
  YamlToProtoValue(yaml, &json_value);

  std::string json;
  auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
  if (!to_json_status.ok()) {
    throw std::runtime_error("Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
  }

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);
  if (!status.ok()) {
    throw std::runtime_error("Invalid configuration: " + std::string(status.message()));
  }

  ConfigLoader::ApplyDefaults(&config);
  ConfigLoader::Validate(config);
  return config;
}

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML config: " + std::string(e.what()));
  }
  return ParseYaml(yaml);
}

RuntimeConfig ConfigLoader::LoadFromYamlString(const std::string& text) {
  YAML::Node yaml;
  try {
    yaml = YAML::Load(text);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to parse YAML config: " + std::string(e.what()));
  }
  return ParseYaml(yaml);
}

void ConfigLoader::ApplyDefaults(RuntimeConfig* config) {
  auto* server = config->mutable_server();
  if (server->bind_address().empty()) server->set_bind_address("0.0.0.0:50061");

  if (config->database().backend_case() == sandbox::runtime::config::DatabaseConfig::BACKEND_NOT_SET) {
    config->mutable_database()->mutable_sqlite()->set_path("sandbox-orchestrator.db");
  }
  if (config->database().has_postgres() && config->database().postgres().pool_size() == 0) {
    config->mutable_database()->mutable_postgres()->set_pool_size(8);
  }

  auto* dispatcher = config->mutable_dispatcher();
  if (dispatcher->poll_interval_ms() == 0) dispatcher->set_poll_interval_ms(250);
  if (dispatcher->lease_ms() == 0) dispatcher->set_lease_ms(60000);
  if (dispatcher->lease_renew_interval_ms() == 0) dispatcher->set_lease_renew_interval_ms(5000);
  if (dispatcher->worker_threads() == 0) dispatcher->set_worker_threads(20);
  if (dispatcher->default_max_attempts() == 0) dispatcher->set_default_max_attempts(3);
  if (dispatcher->initial_concurrency() == 0) dispatcher->set_initial_concurrency(2);

  auto* presence = config->mutable_presence();
  if (presence->heartbeat_interval_ms() == 0) presence->set_heartbeat_interval_ms(15000);
  if (presence->reaper_interval_ms() == 0) presence->set_reaper_interval_ms(30000);
  if (presence->start_max_wait_ms() == 0) presence->set_start_max_wait_ms(30000);
  if (presence->grace_period_ms() == 0) presence->set_grace_period_ms(30000);
  if (presence->idle_timeout_ms() == 0) presence->set_idle_timeout_ms(60000);
  if (presence->preview_host().empty()) presence->set_preview_host("localhost");

  auto* ports = config->mutable_ports();
  if (ports->base().min() == 0 && ports->base().max() == 0) {
    ports->mutable_base()->set_min(3000);
    ports->mutable_base()->set_max(3999);
  }
  if (ports->version().min() == 0 && ports->version().max() == 0) {
    ports->mutable_version()->set_min(5000);
    ports->mutable_version()->set_max(5999);
  }
  if (ports->bind_host().empty()) ports->set_bind_host("127.0.0.1");

  auto* production = config->mutable_production();
  if (production->root_dir().empty()) production->set_root_dir("data/production");
  if (production->keep_versions() == 0) production->set_keep_versions(2);
  if (production->build_timeout_ms() == 0) production->set_build_timeout_ms(5 * 60 * 1000);
  if (production->ready_timeout_ms() == 0) production->set_ready_timeout_ms(300000);
  if (production->ready_probe_interval_ms() == 0) production->set_ready_probe_interval_ms(1000);
  if (production->build_output_dir().empty()) production->set_build_output_dir("dist");
  if (production->public_host().empty()) production->set_public_host("localhost");

  auto* containers = config->mutable_containers();
  if (containers->docker_binary().empty()) containers->set_docker_binary("docker");
  if (containers->compose_file().empty()) containers->set_compose_file("docker-compose.yml");
  if (containers->build_command().empty()) {
    containers->add_build_command("pnpm");
    containers->add_build_command("run");
    containers->add_build_command("build");
  }
  if (containers->compose_timeout_ms() == 0) containers->set_compose_timeout_ms(180000);
  if (containers->stop_timeout_ms() == 0) containers->set_stop_timeout_ms(60000);
  if (containers->probe_timeout_ms() == 0) containers->set_probe_timeout_ms(2000);
  if (containers->session_path().empty()) containers->set_session_path("/session");
  if (containers->container_port() == 0) containers->set_container_port(3000);
  if (containers->session_timeout_ms() == 0) containers->set_session_timeout_ms(10000);
  if (containers->production_image().empty()) containers->set_production_image("node:20-alpine");
}

static void CheckRange(const sandbox::runtime::config::PortRange& range, const char* name) {
  if (range.min() == 0 || range.max() > 65535 || range.min() > range.max()) {
    throw std::runtime_error(std::string("Invalid configuration: ports.") + name + " must satisfy 0 < min <= max <= 65535");
  }
}

static bool Overlaps(const sandbox::runtime::config::PortRange& a, const sandbox::runtime::config::PortRange& b) {
  return a.min() <= b.max() && b.min() <= a.max();
}

void ConfigLoader::Validate(const RuntimeConfig& config) {
  CheckRange(config.ports().base(), "base");
  CheckRange(config.ports().version(), "version");
  if (Overlaps(config.ports().base(), config.ports().version())) {
    throw std::runtime_error("Invalid configuration: ports.base and ports.version overlap");
  }

  const auto& presence = config.presence();
  if (presence.idle_timeout_ms() < presence.heartbeat_interval_ms()) {
    throw std::runtime_error("Invalid configuration: presence.idle_timeout_ms is shorter than the heartbeat interval");
  }

  const auto& dispatcher = config.dispatcher();
  if (dispatcher.lease_renew_interval_ms() >= dispatcher.lease_ms()) {
    throw std::runtime_error("Invalid configuration: dispatcher.lease_renew_interval_ms must be below lease_ms");
  }

  const double ratio = config.observability().trace_sample_ratio();
  if (ratio < 0.0 || ratio > 1.0) {
    throw std::runtime_error("Invalid configuration: observability.trace_sample_ratio must be within [0, 1]");
  }

  if (config.database().has_postgres() && config.database().postgres().connection_uri().empty()) {
    throw std::runtime_error("Invalid configuration: database.postgres.connection_uri is required");
  }
}

} // namespace sandbox::config
