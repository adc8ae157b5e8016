#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/util/time.hpp"

namespace sandbox::projects {

using db::model::ProjectRecord;

/*
  Persistence for project rows. Status and production fields are
  written here only; every write is a read-modify-write in one
  transaction.
*/
class ProjectStore {
 public:
  using Mutator = std::function<void(ProjectRecord&)>;

  explicit ProjectStore(std::shared_ptr<db::Repository> repository, util::NowFn now = util::Now);

  // AlreadyExists when the id is taken.
  ProjectRecord Create(ProjectRecord record);

  std::optional<ProjectRecord> Get(const std::string& id);

  // NotFound when missing.
  ProjectRecord Require(const std::string& id);

  std::vector<ProjectRecord> List();

  // Applies `mutate` to the stored row and writes it back; returns the new row.
  ProjectRecord Update(const std::string& id, const Mutator& mutate);

  ProjectRecord SetStatus(const std::string& id, sandbox::model::ProjectStatus status);

 private:
  std::shared_ptr<db::Repository> repository_;
  util::NowFn                     now_;
};

} // namespace sandbox::projects
