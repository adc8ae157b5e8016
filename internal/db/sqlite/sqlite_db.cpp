#include "sqlite_db.hpp"

#include <filesystem>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace sandbox::db::sqlite {

using observability::IntField;
using observability::StringField;

namespace {

constexpr int kBusyTimeoutMs = 5000;

[[noreturn]] void ThrowSqlite(sqlite3* db, const std::string& what) {
  throw util::StorageError("sqlite " + what + ": " + (db ? sqlite3_errmsg(db) : "no connection"));
}

// ":memory:" and URI filenames have no directory to create.
void EnsureParentDirectory(const std::string& path) {
  if (path.empty() || path == ":memory:" || path.rfind("file:", 0) == 0) return;

  const auto parent = std::filesystem::path(path).parent_path();
  if (parent.empty()) return;

  std::error_code ec;
  std::filesystem::create_directories(parent, ec);
  if (ec) {
    throw util::StorageError("cannot create database directory " + parent.string() + ": " + ec.message());
  }
}

} // namespace

SqliteDB::SqliteDB(std::string path) : path_(std::move(path)) {
  EnsureParentDirectory(path_);

  const int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX | SQLITE_OPEN_URI;
  if (sqlite3_open_v2(path_.c_str(), &db_, flags, nullptr) != SQLITE_OK) {
    const std::string message = db_ ? sqlite3_errmsg(db_) : "out of memory";
    sqlite3_close(db_);
    db_ = nullptr;
    throw util::StorageError("sqlite open " + path_ + ": " + message);
  }

  Configure();
  SANDBOX_LOG_INFO("sqlite database opened", {StringField("path", path_), IntField("busy_timeout_ms", kBusyTimeoutMs)});
}

SqliteDB::~SqliteDB() {
  if (db_ != nullptr && sqlite3_close(db_) != SQLITE_OK) {
    SANDBOX_LOG_WARN("sqlite close failed", {StringField("path", path_), StringField("error", sqlite3_errmsg(db_))});
  }
}

void SqliteDB::Exec(const std::string& sql) {
  char* err = nullptr;
  if (sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err) == SQLITE_OK) return;

  const std::string message = err ? err : sqlite3_errmsg(db_);
  sqlite3_free(err);
  throw util::StorageError("sqlite exec: " + message);
}

sqlite3_stmt* SqliteDB::Prepare(const std::string& sql) {
  sqlite3_stmt* stmt = nullptr;
  if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
    ThrowSqlite(db_, "prepare");
  }
  return stmt;
}

/*
  WAL so sandboxctl and ad-hoc readers never block the dispatcher.
  Claims are short write transactions; waiting on the busy handler beats
  surfacing SQLITE_BUSY to callers.
*/
void SqliteDB::Configure() {
  Exec("PRAGMA journal_mode=WAL;");
  Exec("PRAGMA synchronous=NORMAL;");
  Exec("PRAGMA foreign_keys=ON;");
  if (sqlite3_busy_timeout(db_, kBusyTimeoutMs) != SQLITE_OK) {
    ThrowSqlite(db_, "busy_timeout");
  }
}

} // namespace sandbox::db::sqlite
