#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/presence/presence_manager.hpp"
#include "internal/queue/dispatcher.hpp"
#include "internal/runtime/server.hpp"

namespace {

using sandbox::observability::StringField;

volatile std::sig_atomic_t g_stop_requested = 0;

void OnTerminate(int) {
  g_stop_requested = 1;
}

struct Options {
  std::string config_path;
  bool        check_only = false;
};

void PrintUsage() {
  std::cerr << "usage: sandbox-orchestrator [--check-config] [--config] <config.yaml>\n"
               "       SANDBOX_CONFIG=<config.yaml> sandbox-orchestrator\n";
}

std::optional<Options> ParseArgs(int argc, char** argv) {
  Options options;
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--check-config") {
      options.check_only = true;
    } else if (arg == "--config") {
      if (i + 1 >= argc) return std::nullopt;
      options.config_path = argv[++i];
    } else if (!arg.empty() && arg[0] != '-' && options.config_path.empty()) {
      options.config_path = arg;
    } else {
      return std::nullopt;
    }
  }

  if (options.config_path.empty()) {
    if (const char* env = std::getenv("SANDBOX_CONFIG"); env && *env) options.config_path = env;
  }
  if (options.config_path.empty()) return std::nullopt;
  return options;
}

void ShutdownObservability() {
  sandbox::observability::ShutdownLogging();
  sandbox::observability::ShutdownMetrics();
  sandbox::observability::ShutdownTracing();
}

int Run(const Options& options) {
  const auto config = sandbox::config::ConfigLoader::LoadFromYaml(options.config_path);
  if (options.check_only) {
    std::cout << options.config_path << ": ok\n";
    return 0;
  }

  sandbox::observability::InitializeTracing(config);
  sandbox::observability::InitializeMetrics(config);
  sandbox::observability::InitializeLogging(config);

  auto app = sandbox::factory::Build(config);
  sandbox::runtime::Server server(config.server().bind_address(), std::move(app.grpc_services));

  std::signal(SIGINT, OnTerminate);
  std::signal(SIGTERM, OnTerminate);

  server.Start();
  app.dispatcher->Start();
  app.presence->Start();
  SANDBOX_LOG_INFO("Sandbox orchestrator started", {StringField("config", options.config_path),
                                                    sandbox::observability::IntField("port", server.BoundPort()),
                                                    StringField("worker_id", app.dispatcher->WorkerId())});

  while (!g_stop_requested) std::this_thread::sleep_for(std::chrono::milliseconds(200));

  SANDBOX_LOG_INFO("Stop requested");

  /* RPCs stop first so nothing new is enqueued while in-flight jobs drain. */
  server.Stop();
  app.presence->Stop();
  app.dispatcher->Stop();
  return 0;
}

} // namespace

int main(int argc, char** argv) {
  const auto options = ParseArgs(argc, argv);
  if (!options) {
    PrintUsage();
    return 1;
  }

  int rc = 0;
  try {
    rc = Run(*options);
  } catch (const std::exception& e) {
    SANDBOX_LOG_ERROR("Fatal error", {StringField("error", e.what())});
    if (options->check_only) std::cerr << options->config_path << ": " << e.what() << "\n";
    rc = 2;
  }

  ShutdownObservability();
  return rc;
}
