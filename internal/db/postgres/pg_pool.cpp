#include "pg_pool.hpp"

#include <algorithm>

#include "internal/util/errors.hpp"

namespace sandbox::db::postgres {

namespace {

constexpr const char* kJobColumns =
    "id,type,state,project_id,payload_json,priority,attempts,max_attempts,run_at,locked_at,lock_expires_at,locked_by,"
    "dedupe_key,dedupe_active,cancel_requested_at,cancelled_at,last_error,created_at,updated_at";

constexpr const char* kProjectColumns =
    "id,name,path_on_disk,status,dev_port,runtime_port,production_status,production_hash,production_port,production_url,"
    "production_error,production_started_at,created_at,updated_at";

} // namespace

PgPool::PgPool(std::string conninfo, std::size_t max_connections, std::chrono::milliseconds acquire_timeout)
    : conninfo_(std::move(conninfo)), max_connections_(std::max<std::size_t>(1, max_connections)),
      acquire_timeout_(acquire_timeout) {}

std::shared_ptr<pqxx::connection> PgPool::Acquire() {
  std::unique_lock lock(mutex_);
  const bool       ready =
      available_.wait_for(lock, acquire_timeout_, [this] { return !idle_.empty() || live_ < max_connections_; });
  if (!ready) {
    throw util::StorageError("postgres pool exhausted: " + std::to_string(max_connections_) + " connections in use", true);
  }

  if (!idle_.empty()) {
    auto conn = std::move(idle_.back());
    idle_.pop_back();
    return Lend(std::move(conn));
  }

  /* Reserve the slot, then connect without holding the lock. */
  ++live_;
  lock.unlock();

  std::unique_ptr<pqxx::connection> conn;
  try {
    conn = std::make_unique<pqxx::connection>(conninfo_);
    PrepareStatements(*conn);
  } catch (const pqxx::broken_connection& e) {
    GiveBack(nullptr);
    throw util::StorageError(std::string("postgres connect: ") + e.what(), true);
  } catch (const std::exception&) {
    /* A half-prepared connection is never reused. */
    conn.reset();
    GiveBack(nullptr);
    throw;
  }
  return Lend(std::move(conn));
}

PgPool::Stats PgPool::Snapshot() const {
  std::lock_guard lock(mutex_);
  return Stats{live_, idle_.size()};
}

void PgPool::Migrate(const std::vector<std::string>& ordered_sql) {
  pqxx::connection conn(conninfo_);
  pqxx::work       tx(conn);
  for (const auto& sql : ordered_sql) {
    tx.exec(sql);
  }
  tx.commit();
}

void PgPool::PrepareStatements(pqxx::connection& conn) {
  const std::string job_cols     = kJobColumns;
  const std::string project_cols = kProjectColumns;

  conn.prepare("get_job", "SELECT " + job_cols + " FROM jobs WHERE id=$1");

  conn.prepare("insert_job", "INSERT INTO jobs(" + job_cols +
                                 ") VALUES($1,$2,$3,$4,$5,$6,$7,$8,$9,$10,$11,$12,$13,$14,$15,$16,$17,$18,$19)");

  conn.prepare("find_active_job_by_dedupe",
               "SELECT " + job_cols + " FROM jobs WHERE dedupe_key=$1 AND dedupe_active IS NOT NULL LIMIT 1");

  conn.prepare("list_runnable_jobs",
               "SELECT " + job_cols +
                   " FROM jobs j WHERE j.state='queued' AND j.run_at<=$1"
                   " AND (j.lock_expires_at IS NULL OR j.lock_expires_at<$1)"
                   " AND (j.project_id IS NULL OR NOT EXISTS ("
                   "SELECT 1 FROM jobs r WHERE r.state='running' AND r.project_id=j.project_id))"
                   " ORDER BY j.priority DESC, j.run_at ASC, j.created_at ASC LIMIT $2");

  conn.prepare("update_job_if",
               "UPDATE jobs SET type=$2,state=$3,project_id=$4,payload_json=$5,priority=$6,attempts=$7,max_attempts=$8,"
               "run_at=$9,locked_at=$10,lock_expires_at=$11,locked_by=$12,dedupe_key=$13,dedupe_active=$14,"
               "cancel_requested_at=$15,cancelled_at=$16,last_error=$17,created_at=$18,updated_at=$19 "
               "WHERE id=$1 AND state=$20 AND ($21='' OR locked_by=$21)");

  conn.prepare("delete_job", "DELETE FROM jobs WHERE id=$1");

  conn.prepare("delete_jobs_in_state", "DELETE FROM jobs WHERE state=$1");

  conn.prepare("get_queue_settings", "SELECT paused,concurrency FROM queue_settings WHERE id=1");

  conn.prepare("save_queue_settings",
               "INSERT INTO queue_settings(id,paused,concurrency,updated_at) "
               "VALUES(1,$1,$2,(EXTRACT(EPOCH FROM now())*1000)::BIGINT) "
               "ON CONFLICT(id) DO UPDATE SET paused=EXCLUDED.paused,concurrency=EXCLUDED.concurrency,"
               "updated_at=EXCLUDED.updated_at");

  conn.prepare("insert_port",
               "INSERT INTO ports(port,port_type,project_id,hash,created_at,updated_at) VALUES($1,$2,$3,$4,$5,$6)");

  conn.prepare("get_port", "SELECT port,port_type,project_id,hash,created_at,updated_at FROM ports WHERE port=$1");

  conn.prepare("list_ports_for_project",
               "SELECT port,port_type,project_id,hash,created_at,updated_at FROM ports WHERE project_id=$1 ORDER BY port");

  conn.prepare("delete_port", "DELETE FROM ports WHERE port=$1");

  conn.prepare("insert_project",
               "INSERT INTO projects(" + project_cols + ") VALUES($1,$2,$3,$4,$5,$6,$7,$8,$9,$10,$11,$12,$13,$14)");

  conn.prepare("get_project", "SELECT " + project_cols + " FROM projects WHERE id=$1");

  conn.prepare("list_projects", "SELECT " + project_cols + " FROM projects ORDER BY id");

  conn.prepare("update_project",
               "UPDATE projects SET name=$2,path_on_disk=$3,status=$4,dev_port=$5,runtime_port=$6,production_status=$7,"
               "production_hash=$8,production_port=$9,production_url=$10,production_error=$11,"
               "production_started_at=$12,created_at=$13,updated_at=$14 WHERE id=$1");
}

std::shared_ptr<pqxx::connection> PgPool::Lend(std::unique_ptr<pqxx::connection> conn) {
  std::weak_ptr<PgPool> pool = shared_from_this();
  return std::shared_ptr<pqxx::connection>(conn.release(), [pool](pqxx::connection* returned) {
    if (auto self = pool.lock()) {
      self->GiveBack(returned);
    } else {
      delete returned;
    }
  });
}

// A null or closed connection frees its slot instead of going idle.
void PgPool::GiveBack(pqxx::connection* conn) {
  std::unique_ptr<pqxx::connection> owned(conn);
  {
    std::lock_guard lock(mutex_);
    if (owned && owned->is_open()) {
      idle_.push_back(std::move(owned));
    } else {
      --live_;
    }
  }
  available_.notify_one();
}

} // namespace sandbox::db::postgres
