#pragma once

#include <cstddef>
#include <optional>
#include <string>

#include "internal/model/state_machine.hpp"

namespace sandbox::db {

// limit 0 means unbounded.
struct Pagination {
  std::size_t limit  = 100;
  std::size_t offset = 0;
};

// Empty members match everything. `text` matches payload or last error.
struct JobFilter {
  std::optional<sandbox::model::JobState> state;
  std::string                             type;
  std::string                             project_id;
  std::string                             text;
};

} // namespace sandbox::db
