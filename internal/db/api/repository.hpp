#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/api/types.hpp"
#include "internal/db/model/job_record.hpp"
#include "internal/db/model/port_record.hpp"
#include "internal/db/model/project_record.hpp"
#include "internal/db/model/queue_settings_record.hpp"

namespace sandbox::db {

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All reads and writes happen inside a Transaction
  - Reads inside a transaction see its writes
  - Transactions are serializable with respect to each other
  - Job mutations are compare-and-set on the stored state, so two
    dispatchers racing for the same row cannot both win

  The DB is the source of truth for:
    jobs and queue settings
    port allocations
    project status and production deployment fields
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Jobs
  // ---------------------------------------------------------------------

  // ConstraintViolation when the dedupe slot is already held.
  virtual Result InsertJob(Transaction&, const model::JobRecord&) = 0;

  virtual std::optional<model::JobRecord> GetJob(Transaction&, const std::string& id) = 0;

  virtual std::optional<model::JobRecord> FindActiveJobByDedupeKey(Transaction&, const std::string& dedupe_key) = 0;

  // Newest first.
  virtual std::vector<model::JobRecord> ListJobs(Transaction&, const JobFilter&, const Pagination&) = 0;

  virtual uint64_t CountJobs(Transaction&, const JobFilter&) = 0;

  /*
    Queued jobs with run_at <= now and no live lock, ordered by
    priority desc, run_at asc, created_at asc. Jobs whose project already
    has a running job are excluded.
  */
  virtual std::vector<model::JobRecord> ListRunnableJobs(Transaction&, uint64_t now_ms, std::size_t limit) = 0;

  /*
    Writes the row only if the stored state equals expected_state and,
    when expected_locked_by is non-empty, the stored locked_by matches.
    Conflict when the guard fails, NotFound when the row is gone.
  */
  virtual Result UpdateJobIf(Transaction&, const model::JobRecord&, sandbox::model::JobState expected_state,
                             const std::string& expected_locked_by) = 0;

  // Conflict unless the job is terminal.
  virtual Result DeleteJob(Transaction&, const std::string& id) = 0;

  virtual uint64_t DeleteJobsInState(Transaction&, sandbox::model::JobState state) = 0;

  // ---------------------------------------------------------------------
  // Queue settings
  // ---------------------------------------------------------------------

  virtual std::optional<model::QueueSettingsRecord> GetQueueSettings(Transaction&) = 0;

  virtual Result SaveQueueSettings(Transaction&, const model::QueueSettingsRecord&) = 0;

  // ---------------------------------------------------------------------
  // Ports
  // ---------------------------------------------------------------------

  // AlreadyExists when the port is registered.
  virtual Result InsertPort(Transaction&, const model::PortRecord&) = 0;

  virtual std::optional<model::PortRecord> GetPort(Transaction&, uint32_t port) = 0;

  virtual std::vector<model::PortRecord> ListPortsForProject(Transaction&, const std::string& project_id) = 0;

  virtual Result DeletePort(Transaction&, uint32_t port) = 0;

  // ---------------------------------------------------------------------
  // Projects
  // ---------------------------------------------------------------------

  virtual Result InsertProject(Transaction&, const model::ProjectRecord&) = 0;

  virtual std::optional<model::ProjectRecord> GetProject(Transaction&, const std::string& id) = 0;

  virtual std::vector<model::ProjectRecord> ListProjects(Transaction&) = 0;

  virtual Result UpdateProject(Transaction&, const model::ProjectRecord&) = 0;
};

} // namespace sandbox::db
