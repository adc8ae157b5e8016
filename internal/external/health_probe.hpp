#pragma once

#include <cstdint>

#include "internal/db/model/project_record.hpp"

namespace sandbox::external {

// Bounded-time readiness checks; false on timeout or refusal.
class HealthProbe {
 public:
  virtual ~HealthProbe() = default;

  virtual bool PreviewReady(const db::model::ProjectRecord& project) = 0;
  virtual bool RuntimeReady(const db::model::ProjectRecord& project) = 0;
  virtual bool ProductionReady(uint32_t port)                        = 0;
};

} // namespace sandbox::external
