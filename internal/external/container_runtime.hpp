#pragma once

#include <cstdint>
#include <filesystem>
#include <string>

#include "internal/db/model/project_record.hpp"

namespace sandbox::external {

struct ProductionContainerSpec {
  std::string           project_id;
  std::string           hash;
  std::filesystem::path release_dir;
  uint32_t              host_port = 0;
};

/*
  Container engine as seen by the job handlers. Every call blocks until
  the engine finished or its timeout elapsed and throws on failure.
*/
class ContainerRuntime {
 public:
  virtual ~ContainerRuntime() = default;

  // Preview stack (app + AI runtime) for a project.
  virtual void ComposeUp(const db::model::ProjectRecord& project)   = 0;
  virtual void ComposeDown(const db::model::ProjectRecord& project) = 0;

  // Builds the production bundle; returns the output directory.
  virtual std::filesystem::path BuildProductionBundle(const db::model::ProjectRecord& project) = 0;

  virtual void StartProduction(const ProductionContainerSpec& spec) = 0;

  // No-op when nothing runs for the project.
  virtual void StopProduction(const std::string& project_id) = 0;

  virtual void RemoveProductionImages(const std::string& project_id) = 0;
};

} // namespace sandbox::external
