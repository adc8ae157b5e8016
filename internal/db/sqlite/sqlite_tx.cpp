#include "sqlite_tx.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace sandbox::db::sqlite {

SqliteTransaction::SqliteTransaction(std::shared_ptr<SqliteDB> db) : db_(std::move(db)), guard_(db_->TransactionMutex()) {
  db_->Exec("BEGIN IMMEDIATE;");
}

SqliteTransaction::~SqliteTransaction() {
  if (!Finished()) RollbackQuietly();
}

void SqliteTransaction::Commit() {
  if (Finished()) throw util::InvalidState("sqlite transaction already finished");
  try {
    db_->Exec("COMMIT;");
  } catch (const util::StorageError&) {
    /* A failed COMMIT can leave the transaction open. */
    RollbackQuietly();
    throw;
  }
  guard_.unlock();
}

void SqliteTransaction::Rollback() {
  if (Finished()) return;
  db_->Exec("ROLLBACK;");
  guard_.unlock();
}

void SqliteTransaction::RollbackQuietly() {
  if (sqlite3_get_autocommit(db_->Handle()) == 0) {
    try {
      db_->Exec("ROLLBACK;");
    } catch (const util::StorageError& e) {
      SANDBOX_LOG_WARN("sqlite rollback failed", {observability::StringField("error", e.what())});
    }
  }
  if (guard_.owns_lock()) guard_.unlock();
}

} // namespace sandbox::db::sqlite
