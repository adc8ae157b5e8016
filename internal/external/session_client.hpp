#pragma once

#include "internal/db/model/project_record.hpp"

namespace sandbox::external {

// Bootstraps the AI runtime session of a freshly started preview.
class SessionClient {
 public:
  virtual ~SessionClient() = default;

  virtual void CreateSession(const db::model::ProjectRecord& project) = 0;
};

} // namespace sandbox::external
