#include "pg_repository.hpp"

#include "internal/util/errors.hpp"

namespace sandbox::db::postgres {

using sandbox::db::ErrorCode;
using sandbox::db::Result;
using sandbox::model::JobState;

namespace {

constexpr const char* kJobColumns =
    "id,type,state,project_id,payload_json,priority,attempts,max_attempts,run_at,locked_at,lock_expires_at,locked_by,"
    "dedupe_key,dedupe_active,cancel_requested_at,cancelled_at,last_error,created_at,updated_at";

// Empty strings are stored as NULL.
std::optional<std::string> OptText(const std::string& s) {
  if (s.empty()) return std::nullopt;
  return s;
}

std::optional<int64_t> OptI64(const std::optional<uint64_t>& v) {
  if (!v) return std::nullopt;
  return static_cast<int64_t>(*v);
}

int64_t I64(uint64_t v) {
  return static_cast<int64_t>(v);
}

std::string Text(const pqxx::field& f) {
  return f.is_null() ? "" : f.c_str();
}

uint64_t U64(const pqxx::field& f) {
  return f.is_null() ? 0 : static_cast<uint64_t>(f.as<int64_t>());
}

std::optional<uint64_t> OptU64(const pqxx::field& f) {
  if (f.is_null()) return std::nullopt;
  return static_cast<uint64_t>(f.as<int64_t>());
}

model::JobRecord ReadJob(const pqxx::row& row) {
  model::JobRecord r;
  r.id                     = Text(row[0]);
  r.type                   = Text(row[1]);
  r.state                  = sandbox::model::ParseJobState(Text(row[2])).value_or(JobState::kFailed);
  r.project_id             = Text(row[3]);
  r.payload_json           = Text(row[4]);
  r.priority               = row[5].as<int>();
  r.attempts               = static_cast<uint32_t>(row[6].as<int>());
  r.max_attempts           = static_cast<uint32_t>(row[7].as<int>());
  r.run_at_ms              = U64(row[8]);
  r.locked_at_ms           = OptU64(row[9]);
  r.lock_expires_at_ms     = OptU64(row[10]);
  r.locked_by              = Text(row[11]);
  r.dedupe_key             = Text(row[12]);
  r.dedupe_active          = !row[13].is_null();
  r.cancel_requested_at_ms = OptU64(row[14]);
  r.cancelled_at_ms        = OptU64(row[15]);
  r.last_error             = Text(row[16]);
  r.created_at_ms          = U64(row[17]);
  r.updated_at_ms          = U64(row[18]);
  return r;
}

std::vector<model::JobRecord> ReadJobs(const pqxx::result& res) {
  std::vector<model::JobRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    out.push_back(ReadJob(row));
  }
  return out;
}

model::ProjectRecord ReadProject(const pqxx::row& row) {
  model::ProjectRecord r;
  r.id                       = Text(row[0]);
  r.name                     = Text(row[1]);
  r.path_on_disk             = Text(row[2]);
  r.status                   = sandbox::model::ParseProjectStatus(Text(row[3])).value_or(sandbox::model::ProjectStatus::kError);
  r.dev_port                 = static_cast<uint32_t>(U64(row[4]));
  r.runtime_port             = static_cast<uint32_t>(U64(row[5]));
  r.production_status        = sandbox::model::ParseProductionStatus(Text(row[6])).value_or(sandbox::model::ProductionStatus::kStopped);
  r.production_hash          = Text(row[7]);
  r.production_port          = static_cast<uint32_t>(U64(row[8]));
  r.production_url           = Text(row[9]);
  r.production_error         = Text(row[10]);
  r.production_started_at_ms = U64(row[11]);
  r.created_at_ms            = U64(row[12]);
  r.updated_at_ms            = U64(row[13]);
  return r;
}

model::PortRecord ReadPort(const pqxx::row& row) {
  model::PortRecord r;
  r.port          = static_cast<uint32_t>(row[0].as<int>());
  r.type          = model::ParsePortType(Text(row[1])).value_or(model::PortType::kDev);
  r.project_id    = Text(row[2]);
  r.hash          = Text(row[3]);
  r.created_at_ms = U64(row[4]);
  r.updated_at_ms = U64(row[5]);
  return r;
}

std::string StateText(JobState state) {
  return std::string(sandbox::model::ToString(state));
}

// Literal values are quoted by the open transaction.
std::string FilterClause(pqxx::work& w, const JobFilter& filter) {
  std::string clause = " WHERE TRUE";
  if (filter.state) clause += " AND state=" + w.quote(StateText(*filter.state));
  if (!filter.type.empty()) clause += " AND type=" + w.quote(filter.type);
  if (!filter.project_id.empty()) clause += " AND project_id=" + w.quote(filter.project_id);
  if (!filter.text.empty()) {
    const auto pattern = w.quote("%" + filter.text + "%");
    clause += " AND (payload_json ILIKE " + pattern + " OR COALESCE(last_error,'') ILIKE " + pattern + ")";
  }
  return clause;
}

} // namespace

PgRepository::PgRepository(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
}

std::unique_ptr<db::Transaction> PgRepository::Begin() {
  return std::make_unique<PgTransaction>(pool_);
}

PgTransaction& PgRepository::TX(Transaction& t) {
  return static_cast<PgTransaction&>(t);
}

Result PgRepository::Translate(const std::exception& e) {
  if (dynamic_cast<const pqxx::unique_violation*>(&e) != nullptr) {
    return Result::Err(ErrorCode::ConstraintViolation, e.what());
  }
  if (dynamic_cast<const pqxx::integrity_constraint_violation*>(&e) != nullptr) {
    return Result::Err(ErrorCode::ConstraintViolation, e.what());
  }
  if (dynamic_cast<const pqxx::serialization_failure*>(&e) != nullptr) {
    return Result::Err(ErrorCode::SerializationFailure, e.what());
  }
  if (dynamic_cast<const pqxx::broken_connection*>(&e) != nullptr) {
    return Result::Err(ErrorCode::IOError, e.what());
  }
  return Result::Err(ErrorCode::InternalError, e.what());
}

// ------------------------------------------------------------------
// Jobs
// ------------------------------------------------------------------

Result PgRepository::InsertJob(Transaction& t, const model::JobRecord& r) {
  try {
    auto&              w = TX(t).Work();
    pqxx::subtransaction sub(w, "insert_job");
    sub.exec_prepared("insert_job", r.id, r.type, StateText(r.state), OptText(r.project_id), r.payload_json, r.priority,
                      static_cast<int>(r.attempts), static_cast<int>(r.max_attempts), I64(r.run_at_ms), OptI64(r.locked_at_ms),
                      OptI64(r.lock_expires_at_ms), OptText(r.locked_by), OptText(r.dedupe_key),
                      r.dedupe_active ? std::optional<std::string>("active") : std::nullopt, OptI64(r.cancel_requested_at_ms),
                      OptI64(r.cancelled_at_ms), OptText(r.last_error), I64(r.created_at_ms), I64(r.updated_at_ms));
    sub.commit();
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::JobRecord> PgRepository::GetJob(Transaction& t, const std::string& id) {
  auto res = TX(t).Work().exec_prepared("get_job", id);
  if (res.empty()) return std::nullopt;
  return ReadJob(res[0]);
}

std::optional<model::JobRecord> PgRepository::FindActiveJobByDedupeKey(Transaction& t, const std::string& dedupe_key) {
  auto res = TX(t).Work().exec_prepared("find_active_job_by_dedupe", dedupe_key);
  if (res.empty()) return std::nullopt;
  return ReadJob(res[0]);
}

std::vector<model::JobRecord> PgRepository::ListJobs(Transaction& t, const JobFilter& filter, const Pagination& page) {
  auto&       w   = TX(t).Work();
  std::string sql = std::string("SELECT ") + kJobColumns + " FROM jobs" + FilterClause(w, filter) + " ORDER BY created_at DESC, id DESC";
  if (page.limit > 0) sql += " LIMIT " + std::to_string(page.limit);
  sql += " OFFSET " + std::to_string(page.offset);
  return ReadJobs(w.exec(sql));
}

uint64_t PgRepository::CountJobs(Transaction& t, const JobFilter& filter) {
  auto& w   = TX(t).Work();
  auto  res = w.exec("SELECT COUNT(*) FROM jobs" + FilterClause(w, filter));
  return res.empty() ? 0 : U64(res[0][0]);
}

std::vector<model::JobRecord> PgRepository::ListRunnableJobs(Transaction& t, uint64_t now_ms, std::size_t limit) {
  return ReadJobs(TX(t).Work().exec_prepared("list_runnable_jobs", I64(now_ms), static_cast<int64_t>(limit)));
}

Result PgRepository::UpdateJobIf(Transaction& t, const model::JobRecord& r, JobState expected_state, const std::string& expected_locked_by) {
  pqxx::result res;
  try {
    res = TX(t).Work().exec_prepared(
        "update_job_if", r.id, r.type, StateText(r.state), OptText(r.project_id), r.payload_json, r.priority,
        static_cast<int>(r.attempts), static_cast<int>(r.max_attempts), I64(r.run_at_ms), OptI64(r.locked_at_ms),
        OptI64(r.lock_expires_at_ms), OptText(r.locked_by), OptText(r.dedupe_key),
        r.dedupe_active ? std::optional<std::string>("active") : std::nullopt, OptI64(r.cancel_requested_at_ms),
        OptI64(r.cancelled_at_ms), OptText(r.last_error), I64(r.created_at_ms), I64(r.updated_at_ms), StateText(expected_state),
        expected_locked_by);
  } catch (const std::exception& e) {
    return Translate(e);
  }

  if (res.affected_rows() > 0) return Result::Ok();
  if (!GetJob(t, r.id)) return Result::Err(ErrorCode::NotFound, "job not found: " + r.id);
  return Result::Err(ErrorCode::Conflict, "job changed concurrently: " + r.id);
}

Result PgRepository::DeleteJob(Transaction& t, const std::string& id) {
  auto existing = GetJob(t, id);
  if (!existing) return Result::Err(ErrorCode::NotFound, "job not found: " + id);
  if (!sandbox::model::IsTerminal(existing->state)) return Result::Err(ErrorCode::Conflict, "job is not terminal: " + id);

  try {
    TX(t).Work().exec_prepared("delete_job", id);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

uint64_t PgRepository::DeleteJobsInState(Transaction& t, JobState state) {
  auto res = TX(t).Work().exec_prepared("delete_jobs_in_state", StateText(state));
  return static_cast<uint64_t>(res.affected_rows());
}

// ------------------------------------------------------------------
// Queue settings
// ------------------------------------------------------------------

std::optional<model::QueueSettingsRecord> PgRepository::GetQueueSettings(Transaction& t) {
  auto res = TX(t).Work().exec_prepared("get_queue_settings");
  if (res.empty()) return std::nullopt;

  model::QueueSettingsRecord r;
  r.paused      = res[0][0].as<bool>();
  r.concurrency = static_cast<uint32_t>(res[0][1].as<int>());
  return r;
}

Result PgRepository::SaveQueueSettings(Transaction& t, const model::QueueSettingsRecord& r) {
  try {
    TX(t).Work().exec_prepared("save_queue_settings", r.paused, static_cast<int>(r.concurrency));
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

// ------------------------------------------------------------------
// Ports
// ------------------------------------------------------------------

Result PgRepository::InsertPort(Transaction& t, const model::PortRecord& r) {
  if (GetPort(t, r.port)) return Result::Err(ErrorCode::AlreadyExists, "port registered: " + std::to_string(r.port));

  try {
    TX(t).Work().exec_prepared("insert_port", static_cast<int>(r.port), std::string(model::ToString(r.type)), OptText(r.project_id),
                               OptText(r.hash), I64(r.created_at_ms), I64(r.updated_at_ms));
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::PortRecord> PgRepository::GetPort(Transaction& t, uint32_t port) {
  auto res = TX(t).Work().exec_prepared("get_port", static_cast<int>(port));
  if (res.empty()) return std::nullopt;
  return ReadPort(res[0]);
}

std::vector<model::PortRecord> PgRepository::ListPortsForProject(Transaction& t, const std::string& project_id) {
  auto res = TX(t).Work().exec_prepared("list_ports_for_project", project_id);

  std::vector<model::PortRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    out.push_back(ReadPort(row));
  }
  return out;
}

Result PgRepository::DeletePort(Transaction& t, uint32_t port) {
  try {
    TX(t).Work().exec_prepared("delete_port", static_cast<int>(port));
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

// ------------------------------------------------------------------
// Projects
// ------------------------------------------------------------------

Result PgRepository::InsertProject(Transaction& t, const model::ProjectRecord& r) {
  if (GetProject(t, r.id)) return Result::Err(ErrorCode::AlreadyExists, "project exists: " + r.id);

  try {
    TX(t).Work().exec_prepared("insert_project", r.id, r.name, r.path_on_disk, std::string(sandbox::model::ToString(r.status)),
                               static_cast<int>(r.dev_port), static_cast<int>(r.runtime_port),
                               std::string(sandbox::model::ToString(r.production_status)), OptText(r.production_hash),
                               static_cast<int>(r.production_port), OptText(r.production_url), OptText(r.production_error),
                               I64(r.production_started_at_ms), I64(r.created_at_ms), I64(r.updated_at_ms));
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::ProjectRecord> PgRepository::GetProject(Transaction& t, const std::string& id) {
  auto res = TX(t).Work().exec_prepared("get_project", id);
  if (res.empty()) return std::nullopt;
  return ReadProject(res[0]);
}

std::vector<model::ProjectRecord> PgRepository::ListProjects(Transaction& t) {
  auto res = TX(t).Work().exec_prepared("list_projects");

  std::vector<model::ProjectRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    out.push_back(ReadProject(row));
  }
  return out;
}

Result PgRepository::UpdateProject(Transaction& t, const model::ProjectRecord& r) {
  pqxx::result res;
  try {
    res = TX(t).Work().exec_prepared("update_project", r.id, r.name, r.path_on_disk, std::string(sandbox::model::ToString(r.status)),
                                     static_cast<int>(r.dev_port), static_cast<int>(r.runtime_port),
                                     std::string(sandbox::model::ToString(r.production_status)), OptText(r.production_hash),
                                     static_cast<int>(r.production_port), OptText(r.production_url), OptText(r.production_error),
                                     I64(r.production_started_at_ms), I64(r.created_at_ms), I64(r.updated_at_ms));
  } catch (const std::exception& e) {
    return Translate(e);
  }
  if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound, "project not found: " + r.id);
  return Result::Ok();
}

} // namespace sandbox::db::postgres
