#include "internal/config/config_loader.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

using sandbox::config::ConfigLoader;

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "sandbox_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

void TestFullConfigIsParsed() {
  const auto yaml_path = WriteYaml("full",
                                   R"(server:
  bind_address: "127.0.0.1:6000"
  admin_token: "s3cret"
database:
  sqlite:
    path: "/var/lib/sandbox/orchestrator.db"
dispatcher:
  worker_id: "node-a"
  lease_ms: 30000
  initial_concurrency: 5
presence:
  heartbeat_interval_ms: 10000
  preview_host: "preview.internal"
ports:
  base:
    min: 4000
    max: 4099
production:
  root_dir: "/srv/releases"
  keep_versions: 3
containers:
  build_command: ["npm", "run", "build"]
  production_image: "node:22-alpine"
)");

  auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.server().bind_address() == "127.0.0.1:6000");
  assert(config.server().admin_token() == "s3cret");
  assert(config.database().has_sqlite());
  assert(config.database().sqlite().path() == "/var/lib/sandbox/orchestrator.db");
  assert(config.dispatcher().worker_id() == "node-a");
  assert(config.dispatcher().lease_ms() == 30000);
  assert(config.dispatcher().initial_concurrency() == 5);
  assert(config.presence().heartbeat_interval_ms() == 10000);
  assert(config.presence().preview_host() == "preview.internal");
  assert(config.ports().base().min() == 4000);
  assert(config.ports().base().max() == 4099);
  assert(config.production().root_dir() == "/srv/releases");
  assert(config.production().keep_versions() == 3);
  assert(config.containers().build_command_size() == 3);
  assert(config.containers().build_command(0) == "npm");
  assert(config.containers().production_image() == "node:22-alpine");

  // Unset sections fall back to defaults.
  assert(config.presence().idle_timeout_ms() == 60000);
  assert(config.ports().version().min() == 5000);
  assert(config.production().ready_timeout_ms() == 300000);
}

void TestEmptyDocumentYieldsDefaults() {
  auto config = ConfigLoader::LoadFromYamlString("");
  assert(!config.server().bind_address().empty());
  assert(config.database().has_sqlite());
  assert(config.dispatcher().default_max_attempts() == 3);
  assert(config.dispatcher().initial_concurrency() == 2);
  assert(config.presence().heartbeat_interval_ms() == 15000);
  assert(config.presence().grace_period_ms() == 30000);
  assert(config.ports().base().min() == 3000);
  assert(config.ports().base().max() == 3999);
  assert(config.ports().version().max() == 5999);
  assert(config.production().keep_versions() == 2);
  assert(config.containers().docker_binary() == "docker");
}

void TestMemoryBackendSelection() {
  auto config = ConfigLoader::LoadFromYamlString(R"(database:
  memory: {}
)");
  assert(config.database().has_memory());
  assert(!config.database().has_sqlite());
}

void TestScalarEscapingForQuotedAndBackslashValues() {
  auto config = ConfigLoader::LoadFromYamlString(R"(database:
  sqlite:
    path: "C:\\sandbox\\\"quoted\"\\db.sqlite"
)");
  assert(config.database().sqlite().path() == "C:\\sandbox\\\"quoted\"\\db.sqlite");
}

void TestQuotedNumberStaysString() {
  auto config = ConfigLoader::LoadFromYamlString(R"(server:
  admin_token: "12345"
)");
  assert(config.server().admin_token() == "12345");
}

void TestUnknownFieldsAreRejected() {
  const auto yaml_path = WriteYaml("unknown_field",
                                   R"(server:
  bind_address: "0.0.0.0:50061"
unknown_field: 123
)");

  bool threw = false;
  try {
    (void)ConfigLoader::LoadFromYaml(yaml_path.string());
  } catch (const std::runtime_error&) {
    threw = true;
  }

  assert(threw && "ConfigLoader must reject unknown fields.");
}

void TestMissingFileThrows() {
  bool threw = false;
  try {
    (void)ConfigLoader::LoadFromYaml("/nonexistent/sandbox-orchestrator.yaml");
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

void TestShippedExampleConfigLoads() {
  auto config = ConfigLoader::LoadFromYaml(SANDBOX_EXAMPLE_CONFIG);
  assert(config.database().has_sqlite());
  assert(config.observability().transport() == sandbox::runtime::config::OTLP_TRANSPORT_GRPC);
  assert(config.observability().trace_sample_ratio() == 1.0);
  assert(config.containers().build_command_size() == 3);
  assert(config.ports().version().max() == 5999);
}

bool Rejects(const std::string& yaml) {
  try {
    (void)ConfigLoader::LoadFromYamlString(yaml);
  } catch (const std::runtime_error&) {
    return true;
  }
  return false;
}

void TestInconsistentSettingsAreRejected() {
  assert(Rejects("ports:\n  base:\n    min: 4100\n    max: 4000\n"));
  assert(Rejects("ports:\n  base:\n    min: 5500\n    max: 5600\n"));
  assert(Rejects("ports:\n  version:\n    min: 60000\n    max: 70000\n"));
  assert(Rejects("presence:\n  heartbeat_interval_ms: 90000\n"));
  assert(Rejects("dispatcher:\n  lease_ms: 4000\n"));
  assert(Rejects("observability:\n  trace_sample_ratio: 1.5\n"));
  assert(Rejects("database:\n  postgres:\n    pool_size: 2\n"));

  assert(!Rejects("observability:\n  trace_sample_ratio: 0.25\n"));
}

} // namespace

int main() {
  TestFullConfigIsParsed();
  TestEmptyDocumentYieldsDefaults();
  TestMemoryBackendSelection();
  TestScalarEscapingForQuotedAndBackslashValues();
  TestQuotedNumberStaysString();
  TestUnknownFieldsAreRejected();
  TestMissingFileThrows();
  TestInconsistentSettingsAreRejected();
  TestShippedExampleConfigLoads();

  std::cout << "sandbox_unit_config_loader: pass\n";
  return 0;
}
