#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <vector>

#include "internal/util/errors.hpp"

namespace sandbox::db::sqlite {

using sandbox::db::ErrorCode;
using sandbox::db::Result;
using sandbox::model::JobState;

namespace {

constexpr const char* kJobColumns =
    "id,type,state,project_id,payload_json,priority,attempts,max_attempts,run_at,locked_at,lock_expires_at,locked_by,"
    "dedupe_key,dedupe_active,cancel_requested_at,cancelled_at,last_error,created_at,updated_at";

constexpr const char* kProjectColumns =
    "id,name,path_on_disk,status,dev_port,runtime_port,production_status,production_hash,production_port,production_url,"
    "production_error,production_started_at,created_at,updated_at";

struct StatementDeleter {
  void operator()(sqlite3_stmt* st) const {
    sqlite3_finalize(st);
  }
};

using Statement = std::unique_ptr<sqlite3_stmt, StatementDeleter>;

Statement Prepare(sqlite3* db, const std::string& sql) {
  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, sql.c_str(), -1, &st, nullptr) != SQLITE_OK) {
    throw sandbox::util::StorageError(std::string("sqlite prepare: ") + sqlite3_errmsg(db));
  }
  return Statement(st);
}

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

// Empty strings are stored as NULL.
void BindOptText(sqlite3_stmt* st, int idx, const std::string& s) {
  if (s.empty()) {
    sqlite3_bind_null(st, idx);
  } else {
    BindText(st, idx, s);
  }
}

void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindOptU64(sqlite3_stmt* st, int idx, const std::optional<uint64_t>& v) {
  if (v) {
    BindU64(st, idx, *v);
  } else {
    sqlite3_bind_null(st, idx);
  }
}

void BindI64(sqlite3_stmt* st, int idx, int64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

uint64_t ColU64(sqlite3_stmt* st, int col) {
  return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

std::optional<uint64_t> ColOptU64(sqlite3_stmt* st, int col) {
  if (sqlite3_column_type(st, col) == SQLITE_NULL) return std::nullopt;
  return ColU64(st, col);
}

int BindJob(sqlite3_stmt* st, const model::JobRecord& r) {
  int i = 1;
  BindText(st, i++, r.id);
  BindText(st, i++, r.type);
  BindText(st, i++, std::string(sandbox::model::ToString(r.state)));
  BindOptText(st, i++, r.project_id);
  BindText(st, i++, r.payload_json);
  BindI64(st, i++, r.priority);
  BindI64(st, i++, r.attempts);
  BindI64(st, i++, r.max_attempts);
  BindU64(st, i++, r.run_at_ms);
  BindOptU64(st, i++, r.locked_at_ms);
  BindOptU64(st, i++, r.lock_expires_at_ms);
  BindOptText(st, i++, r.locked_by);
  BindOptText(st, i++, r.dedupe_key);
  BindOptText(st, i++, r.dedupe_active ? std::string("active") : std::string());
  BindOptU64(st, i++, r.cancel_requested_at_ms);
  BindOptU64(st, i++, r.cancelled_at_ms);
  BindOptText(st, i++, r.last_error);
  BindU64(st, i++, r.created_at_ms);
  BindU64(st, i++, r.updated_at_ms);
  return i;
}

model::JobRecord ReadJob(sqlite3_stmt* st) {
  model::JobRecord r;
  r.id                     = ColText(st, 0);
  r.type                   = ColText(st, 1);
  r.state                  = sandbox::model::ParseJobState(ColText(st, 2)).value_or(JobState::kFailed);
  r.project_id             = ColText(st, 3);
  r.payload_json           = ColText(st, 4);
  r.priority               = sqlite3_column_int(st, 5);
  r.attempts               = static_cast<uint32_t>(sqlite3_column_int(st, 6));
  r.max_attempts           = static_cast<uint32_t>(sqlite3_column_int(st, 7));
  r.run_at_ms              = ColU64(st, 8);
  r.locked_at_ms           = ColOptU64(st, 9);
  r.lock_expires_at_ms     = ColOptU64(st, 10);
  r.locked_by              = ColText(st, 11);
  r.dedupe_key             = ColText(st, 12);
  r.dedupe_active          = sqlite3_column_type(st, 13) != SQLITE_NULL;
  r.cancel_requested_at_ms = ColOptU64(st, 14);
  r.cancelled_at_ms        = ColOptU64(st, 15);
  r.last_error             = ColText(st, 16);
  r.created_at_ms          = ColU64(st, 17);
  r.updated_at_ms          = ColU64(st, 18);
  return r;
}

std::vector<model::JobRecord> ReadJobs(sqlite3_stmt* st) {
  std::vector<model::JobRecord> out;
  while (sqlite3_step(st) == SQLITE_ROW) {
    out.push_back(ReadJob(st));
  }
  return out;
}

int BindProject(sqlite3_stmt* st, const model::ProjectRecord& r) {
  int i = 1;
  BindText(st, i++, r.id);
  BindText(st, i++, r.name);
  BindText(st, i++, r.path_on_disk);
  BindText(st, i++, std::string(sandbox::model::ToString(r.status)));
  BindI64(st, i++, r.dev_port);
  BindI64(st, i++, r.runtime_port);
  BindText(st, i++, std::string(sandbox::model::ToString(r.production_status)));
  BindOptText(st, i++, r.production_hash);
  BindI64(st, i++, r.production_port);
  BindOptText(st, i++, r.production_url);
  BindOptText(st, i++, r.production_error);
  BindU64(st, i++, r.production_started_at_ms);
  BindU64(st, i++, r.created_at_ms);
  BindU64(st, i++, r.updated_at_ms);
  return i;
}

model::ProjectRecord ReadProject(sqlite3_stmt* st) {
  model::ProjectRecord r;
  r.id                       = ColText(st, 0);
  r.name                     = ColText(st, 1);
  r.path_on_disk             = ColText(st, 2);
  r.status                   = sandbox::model::ParseProjectStatus(ColText(st, 3)).value_or(sandbox::model::ProjectStatus::kError);
  r.dev_port                 = static_cast<uint32_t>(sqlite3_column_int(st, 4));
  r.runtime_port             = static_cast<uint32_t>(sqlite3_column_int(st, 5));
  r.production_status        = sandbox::model::ParseProductionStatus(ColText(st, 6)).value_or(sandbox::model::ProductionStatus::kStopped);
  r.production_hash          = ColText(st, 7);
  r.production_port          = static_cast<uint32_t>(sqlite3_column_int(st, 8));
  r.production_url           = ColText(st, 9);
  r.production_error         = ColText(st, 10);
  r.production_started_at_ms = ColU64(st, 11);
  r.created_at_ms            = ColU64(st, 12);
  r.updated_at_ms            = ColU64(st, 13);
  return r;
}

model::PortRecord ReadPort(sqlite3_stmt* st) {
  model::PortRecord r;
  r.port          = static_cast<uint32_t>(sqlite3_column_int(st, 0));
  r.type          = model::ParsePortType(ColText(st, 1)).value_or(model::PortType::kDev);
  r.project_id    = ColText(st, 2);
  r.hash          = ColText(st, 3);
  r.created_at_ms = ColU64(st, 4);
  r.updated_at_ms = ColU64(st, 5);
  return r;
}

// WHERE clause for a JobFilter; values are bound in order by BindFilter.
std::string FilterClause(const JobFilter& filter) {
  std::string clause = " WHERE 1=1";
  if (filter.state) clause += " AND state=?";
  if (!filter.type.empty()) clause += " AND type=?";
  if (!filter.project_id.empty()) clause += " AND project_id=?";
  if (!filter.text.empty()) clause += " AND (payload_json LIKE ? OR IFNULL(last_error,'') LIKE ?)";
  return clause;
}

int BindFilter(sqlite3_stmt* st, const JobFilter& filter) {
  int i = 1;
  if (filter.state) BindText(st, i++, std::string(sandbox::model::ToString(*filter.state)));
  if (!filter.type.empty()) BindText(st, i++, filter.type);
  if (!filter.project_id.empty()) BindText(st, i++, filter.project_id);
  if (!filter.text.empty()) {
    const auto pattern = "%" + filter.text + "%";
    BindText(st, i++, pattern);
    BindText(st, i++, pattern);
  }
  return i;
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
  return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
  return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW) return Result::Ok();

  switch (rc) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
    case SQLITE_CONSTRAINT:
      return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
    case SQLITE_IOERR:
      return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
    case SQLITE_CORRUPT:
      return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
    default:
      return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
}

// ------------------------------------------------------------------
// Jobs
// ------------------------------------------------------------------

Result SqliteRepository::InsertJob(Transaction& t, const model::JobRecord& r) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, std::string("INSERT INTO jobs(") + kJobColumns + ") VALUES(?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?);");
  BindJob(st.get(), r);
  return Translate(db, sqlite3_step(st.get()));
}

std::optional<model::JobRecord> SqliteRepository::GetJob(Transaction& t, const std::string& id) {
  auto st = Prepare(TX(t).Handle(), std::string("SELECT ") + kJobColumns + " FROM jobs WHERE id=?;");
  BindText(st.get(), 1, id);
  if (sqlite3_step(st.get()) != SQLITE_ROW) return std::nullopt;
  return ReadJob(st.get());
}

std::optional<model::JobRecord> SqliteRepository::FindActiveJobByDedupeKey(Transaction& t, const std::string& dedupe_key) {
  auto st = Prepare(TX(t).Handle(), std::string("SELECT ") + kJobColumns + " FROM jobs WHERE dedupe_key=? AND dedupe_active IS NOT NULL LIMIT 1;");
  BindText(st.get(), 1, dedupe_key);
  if (sqlite3_step(st.get()) != SQLITE_ROW) return std::nullopt;
  return ReadJob(st.get());
}

std::vector<model::JobRecord> SqliteRepository::ListJobs(Transaction& t, const JobFilter& filter, const Pagination& page) {
  auto st = Prepare(TX(t).Handle(), std::string("SELECT ") + kJobColumns + " FROM jobs" + FilterClause(filter) +
                                        " ORDER BY created_at DESC, id DESC LIMIT ? OFFSET ?;");
  int  i  = BindFilter(st.get(), filter);
  BindI64(st.get(), i++, page.limit > 0 ? static_cast<int64_t>(page.limit) : -1);
  BindU64(st.get(), i++, page.offset);
  return ReadJobs(st.get());
}

uint64_t SqliteRepository::CountJobs(Transaction& t, const JobFilter& filter) {
  auto st = Prepare(TX(t).Handle(), "SELECT COUNT(*) FROM jobs" + FilterClause(filter) + ";");
  BindFilter(st.get(), filter);
  if (sqlite3_step(st.get()) != SQLITE_ROW) return 0;
  return ColU64(st.get(), 0);
}

std::vector<model::JobRecord> SqliteRepository::ListRunnableJobs(Transaction& t, uint64_t now_ms, std::size_t limit) {
  auto st = Prepare(TX(t).Handle(), std::string("SELECT ") + kJobColumns +
                                        " FROM jobs j WHERE j.state='queued' AND j.run_at<=?"
                                        " AND (j.lock_expires_at IS NULL OR j.lock_expires_at<?)"
                                        " AND (j.project_id IS NULL OR NOT EXISTS ("
                                        "SELECT 1 FROM jobs r WHERE r.state='running' AND r.project_id=j.project_id))"
                                        " ORDER BY j.priority DESC, j.run_at ASC, j.created_at ASC LIMIT ?;");
  BindU64(st.get(), 1, now_ms);
  BindU64(st.get(), 2, now_ms);
  BindI64(st.get(), 3, static_cast<int64_t>(limit));
  return ReadJobs(st.get());
}

Result SqliteRepository::UpdateJobIf(Transaction& t, const model::JobRecord& r, JobState expected_state, const std::string& expected_locked_by) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db,
                     "UPDATE jobs SET id=?,type=?,state=?,project_id=?,payload_json=?,priority=?,attempts=?,max_attempts=?,run_at=?,"
                     "locked_at=?,lock_expires_at=?,locked_by=?,dedupe_key=?,dedupe_active=?,cancel_requested_at=?,cancelled_at=?,"
                     "last_error=?,created_at=?,updated_at=? WHERE id=? AND state=? AND (?='' OR locked_by=?);");
  int i = BindJob(st.get(), r);
  BindText(st.get(), i++, r.id);
  BindText(st.get(), i++, std::string(sandbox::model::ToString(expected_state)));
  BindText(st.get(), i++, expected_locked_by);
  BindText(st.get(), i++, expected_locked_by);

  auto result = Translate(db, sqlite3_step(st.get()));
  if (!result) return result;
  if (sqlite3_changes(db) > 0) return Result::Ok();

  if (!GetJob(t, r.id)) return Result::Err(ErrorCode::NotFound, "job not found: " + r.id);
  return Result::Err(ErrorCode::Conflict, "job changed concurrently: " + r.id);
}

Result SqliteRepository::DeleteJob(Transaction& t, const std::string& id) {
  auto existing = GetJob(t, id);
  if (!existing) return Result::Err(ErrorCode::NotFound, "job not found: " + id);
  if (!sandbox::model::IsTerminal(existing->state)) return Result::Err(ErrorCode::Conflict, "job is not terminal: " + id);

  auto* db = TX(t).Handle();
  auto  st = Prepare(db, "DELETE FROM jobs WHERE id=?;");
  BindText(st.get(), 1, id);
  return Translate(db, sqlite3_step(st.get()));
}

uint64_t SqliteRepository::DeleteJobsInState(Transaction& t, JobState state) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, "DELETE FROM jobs WHERE state=?;");
  BindText(st.get(), 1, std::string(sandbox::model::ToString(state)));
  auto result = Translate(db, sqlite3_step(st.get()));
  if (!result) throw sandbox::util::StorageError(result.message);
  return static_cast<uint64_t>(sqlite3_changes(db));
}

// ------------------------------------------------------------------
// Queue settings
// ------------------------------------------------------------------

std::optional<model::QueueSettingsRecord> SqliteRepository::GetQueueSettings(Transaction& t) {
  auto st = Prepare(TX(t).Handle(), "SELECT paused,concurrency FROM queue_settings WHERE id=1;");
  if (sqlite3_step(st.get()) != SQLITE_ROW) return std::nullopt;
  model::QueueSettingsRecord r;
  r.paused      = sqlite3_column_int(st.get(), 0) != 0;
  r.concurrency = static_cast<uint32_t>(sqlite3_column_int(st.get(), 1));
  return r;
}

Result SqliteRepository::SaveQueueSettings(Transaction& t, const model::QueueSettingsRecord& r) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db,
                     "INSERT INTO queue_settings(id,paused,concurrency,updated_at) VALUES(1,?,?,CAST(strftime('%s','now') AS INTEGER)*1000) "
                     "ON CONFLICT(id) DO UPDATE SET paused=excluded.paused,concurrency=excluded.concurrency,updated_at=excluded.updated_at;");
  BindI64(st.get(), 1, r.paused ? 1 : 0);
  BindI64(st.get(), 2, r.concurrency);
  return Translate(db, sqlite3_step(st.get()));
}

// ------------------------------------------------------------------
// Ports
// ------------------------------------------------------------------

Result SqliteRepository::InsertPort(Transaction& t, const model::PortRecord& r) {
  if (GetPort(t, r.port)) return Result::Err(ErrorCode::AlreadyExists, "port registered: " + std::to_string(r.port));

  auto* db = TX(t).Handle();
  auto  st = Prepare(db, "INSERT INTO ports(port,port_type,project_id,hash,created_at,updated_at) VALUES(?,?,?,?,?,?);");
  BindI64(st.get(), 1, r.port);
  BindText(st.get(), 2, std::string(model::ToString(r.type)));
  BindOptText(st.get(), 3, r.project_id);
  BindOptText(st.get(), 4, r.hash);
  BindU64(st.get(), 5, r.created_at_ms);
  BindU64(st.get(), 6, r.updated_at_ms);
  return Translate(db, sqlite3_step(st.get()));
}

std::optional<model::PortRecord> SqliteRepository::GetPort(Transaction& t, uint32_t port) {
  auto st = Prepare(TX(t).Handle(), "SELECT port,port_type,project_id,hash,created_at,updated_at FROM ports WHERE port=?;");
  BindI64(st.get(), 1, port);
  if (sqlite3_step(st.get()) != SQLITE_ROW) return std::nullopt;
  return ReadPort(st.get());
}

std::vector<model::PortRecord> SqliteRepository::ListPortsForProject(Transaction& t, const std::string& project_id) {
  auto st = Prepare(TX(t).Handle(), "SELECT port,port_type,project_id,hash,created_at,updated_at FROM ports WHERE project_id=? ORDER BY port;");
  BindText(st.get(), 1, project_id);
  std::vector<model::PortRecord> out;
  while (sqlite3_step(st.get()) == SQLITE_ROW) {
    out.push_back(ReadPort(st.get()));
  }
  return out;
}

Result SqliteRepository::DeletePort(Transaction& t, uint32_t port) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, "DELETE FROM ports WHERE port=?;");
  BindI64(st.get(), 1, port);
  return Translate(db, sqlite3_step(st.get()));
}

// ------------------------------------------------------------------
// Projects
// ------------------------------------------------------------------

Result SqliteRepository::InsertProject(Transaction& t, const model::ProjectRecord& r) {
  if (GetProject(t, r.id)) return Result::Err(ErrorCode::AlreadyExists, "project exists: " + r.id);

  auto* db = TX(t).Handle();
  auto  st = Prepare(db, std::string("INSERT INTO projects(") + kProjectColumns + ") VALUES(?,?,?,?,?,?,?,?,?,?,?,?,?,?);");
  BindProject(st.get(), r);
  return Translate(db, sqlite3_step(st.get()));
}

std::optional<model::ProjectRecord> SqliteRepository::GetProject(Transaction& t, const std::string& id) {
  auto st = Prepare(TX(t).Handle(), std::string("SELECT ") + kProjectColumns + " FROM projects WHERE id=?;");
  BindText(st.get(), 1, id);
  if (sqlite3_step(st.get()) != SQLITE_ROW) return std::nullopt;
  return ReadProject(st.get());
}

std::vector<model::ProjectRecord> SqliteRepository::ListProjects(Transaction& t) {
  auto st = Prepare(TX(t).Handle(), std::string("SELECT ") + kProjectColumns + " FROM projects ORDER BY id;");
  std::vector<model::ProjectRecord> out;
  while (sqlite3_step(st.get()) == SQLITE_ROW) {
    out.push_back(ReadProject(st.get()));
  }
  return out;
}

Result SqliteRepository::UpdateProject(Transaction& t, const model::ProjectRecord& r) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db,
                     "UPDATE projects SET id=?,name=?,path_on_disk=?,status=?,dev_port=?,runtime_port=?,production_status=?,"
                     "production_hash=?,production_port=?,production_url=?,production_error=?,production_started_at=?,"
                     "created_at=?,updated_at=? WHERE id=?;");
  int i = BindProject(st.get(), r);
  BindText(st.get(), i, r.id);

  auto result = Translate(db, sqlite3_step(st.get()));
  if (!result) return result;
  if (sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound, "project not found: " + r.id);
  return Result::Ok();
}

} // namespace sandbox::db::sqlite
