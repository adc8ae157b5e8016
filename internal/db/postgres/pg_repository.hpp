#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "pg_pool.hpp"
#include "pg_tx.hpp"

namespace sandbox::db::postgres {

class PgRepository final : public db::Repository {
 public:
  explicit PgRepository(std::shared_ptr<PgPool> pool);

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
  std::shared_ptr<PgPool> pool_;

  static PgTransaction& TX(Transaction& t);
  static Result         Translate(const std::exception&);
};

} // namespace sandbox::db::postgres
