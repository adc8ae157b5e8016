#pragma once

#include <chrono>
#include <string>
#include <vector>

#include "internal/external/container_runtime.hpp"
#include "internal/external/process_runner.hpp"

namespace sandbox::runtime::config {
class RuntimeConfig;
}

namespace sandbox::external {

struct DockerCliOptions {
  std::string               docker_binary = "docker";
  std::string               compose_file  = "docker-compose.yml";
  std::vector<std::string>  build_command = {"pnpm", "run", "build"};
  std::string               build_output_dir = "dist";
  std::string               production_image = "node:20-alpine";
  uint32_t                  container_port   = 3000;
  std::chrono::milliseconds compose_timeout{180000};
  std::chrono::milliseconds stop_timeout{60000};
  std::chrono::milliseconds build_timeout{300000};

  static DockerCliOptions FromConfig(const sandbox::runtime::config::RuntimeConfig& config);
};

/*
  ContainerRuntime over the docker CLI.

  Previews run as a compose project named `sandbox_<projectId>` from the
  project directory. A production release runs as the single container
  `sandbox_prod_<projectId>` serving the release directory read-only on
  the host port.
*/
class DockerCliRuntime final : public ContainerRuntime {
 public:
  explicit DockerCliRuntime(DockerCliOptions options);

  void ComposeUp(const db::model::ProjectRecord& project) override;
  void ComposeDown(const db::model::ProjectRecord& project) override;

  std::filesystem::path BuildProductionBundle(const db::model::ProjectRecord& project) override;

  void StartProduction(const ProductionContainerSpec& spec) override;
  void StopProduction(const std::string& project_id) override;
  void RemoveProductionImages(const std::string& project_id) override;

  static std::string ComposeProjectName(const std::string& project_id);
  static std::string ProductionContainerName(const std::string& project_id);

 private:
  std::vector<std::string> ComposeArgs(const db::model::ProjectRecord& project) const;

  // Ids reported by `docker <object> ls -q` for the project's label.
  std::vector<std::string> ListLabelled(const std::string& object, const std::string& project_id);

  DockerCliOptions options_;
};

} // namespace sandbox::external
