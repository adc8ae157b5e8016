#pragma once

#include <cstdint>
#include <string>

#include "internal/model/state_machine.hpp"

namespace sandbox::db::model {

/*
  Project row. `status` is the durable source of truth for the preview
  containers; the production_* fields describe the production deployment.
*/
struct ProjectRecord {
  std::string                      id;
  std::string                      name;
  std::string                      path_on_disk;
  sandbox::model::ProjectStatus    status       = sandbox::model::ProjectStatus::kCreated;
  uint32_t                         dev_port     = 0;
  uint32_t                         runtime_port = 0;
  sandbox::model::ProductionStatus production_status = sandbox::model::ProductionStatus::kStopped;
  std::string                      production_hash;
  uint32_t                         production_port = 0;
  std::string                      production_url;
  std::string                      production_error;
  uint64_t                         production_started_at_ms = 0;
  uint64_t                         created_at_ms            = 0;
  uint64_t                         updated_at_ms            = 0;
};

} // namespace sandbox::db::model
