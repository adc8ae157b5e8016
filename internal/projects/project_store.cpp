#include "project_store.hpp"

#include "internal/db/api/errors.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace sandbox::projects {

using observability::StringField;

ProjectStore::ProjectStore(std::shared_ptr<db::Repository> repository, util::NowFn now)
    : repository_(std::move(repository)), now_(std::move(now)) {
}

ProjectRecord ProjectStore::Create(ProjectRecord record) {
  const auto now_ms    = util::NowMillis(now_);
  record.created_at_ms = now_ms;
  record.updated_at_ms = now_ms;

  auto tx = repository_->Begin();
  db::ThrowIfDbError(repository_->InsertProject(*tx, record), "create project " + record.id);
  tx->Commit();

  SANDBOX_LOG_INFO("project created", {StringField("project_id", record.id), StringField("name", record.name)});
  return record;
}

std::optional<ProjectRecord> ProjectStore::Get(const std::string& id) {
  auto tx      = repository_->Begin();
  auto project = repository_->GetProject(*tx, id);
  tx->Commit();
  return project;
}

ProjectRecord ProjectStore::Require(const std::string& id) {
  auto project = Get(id);
  if (!project) {
    throw util::NotFound("project not found: " + id);
  }
  return *project;
}

std::vector<ProjectRecord> ProjectStore::List() {
  auto tx       = repository_->Begin();
  auto projects = repository_->ListProjects(*tx);
  tx->Commit();
  return projects;
}

ProjectRecord ProjectStore::Update(const std::string& id, const Mutator& mutate) {
  auto tx      = repository_->Begin();
  auto project = repository_->GetProject(*tx, id);
  if (!project) {
    throw util::NotFound("project not found: " + id);
  }

  mutate(*project);
  project->id            = id;
  project->updated_at_ms = util::NowMillis(now_);
  db::ThrowIfDbError(repository_->UpdateProject(*tx, *project), "update project " + id);
  tx->Commit();
  return *project;
}

ProjectRecord ProjectStore::SetStatus(const std::string& id, sandbox::model::ProjectStatus status) {
  auto project = Update(id, [status](ProjectRecord& p) { p.status = status; });
  SANDBOX_LOG_INFO("project status changed", {StringField("project_id", id), StringField("status", sandbox::model::ToString(status))});
  return project;
}

} // namespace sandbox::projects
