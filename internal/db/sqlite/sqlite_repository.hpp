#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace sandbox::db::sqlite {

class SqliteRepository final : public db::Repository {
 public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

  std::unique_ptr<Transaction> Begin() override;

  Result                          InsertJob(Transaction&, const model::JobRecord&) override;
  std::optional<model::JobRecord> GetJob(Transaction&, const std::string& id) override;
  std::optional<model::JobRecord> FindActiveJobByDedupeKey(Transaction&, const std::string& dedupe_key) override;
  std::vector<model::JobRecord>   ListJobs(Transaction&, const JobFilter&, const Pagination&) override;
  uint64_t                        CountJobs(Transaction&, const JobFilter&) override;
  std::vector<model::JobRecord>   ListRunnableJobs(Transaction&, uint64_t now_ms, std::size_t limit) override;
  Result   UpdateJobIf(Transaction&, const model::JobRecord&, sandbox::model::JobState expected_state, const std::string& expected_locked_by) override;
  Result   DeleteJob(Transaction&, const std::string& id) override;
  uint64_t DeleteJobsInState(Transaction&, sandbox::model::JobState state) override;

  std::optional<model::QueueSettingsRecord> GetQueueSettings(Transaction&) override;
  Result                                    SaveQueueSettings(Transaction&, const model::QueueSettingsRecord&) override;

  Result                           InsertPort(Transaction&, const model::PortRecord&) override;
  std::optional<model::PortRecord> GetPort(Transaction&, uint32_t port) override;
  std::vector<model::PortRecord>   ListPortsForProject(Transaction&, const std::string& project_id) override;
  Result                           DeletePort(Transaction&, uint32_t port) override;

  Result                              InsertProject(Transaction&, const model::ProjectRecord&) override;
  std::optional<model::ProjectRecord> GetProject(Transaction&, const std::string& id) override;
  std::vector<model::ProjectRecord>   ListProjects(Transaction&) override;
  Result                              UpdateProject(Transaction&, const model::ProjectRecord&) override;

 private:
  std::shared_ptr<SqliteDB> db_;

  static SqliteTransaction& TX(Transaction& t);
  static Result             Translate(sqlite3* db, int rc);
};

} // namespace sandbox::db::sqlite
