#pragma once

#include <memory>
#include <mutex>

#include "internal/db/api/transaction.hpp"
#include "sqlite_db.hpp"

namespace sandbox::db::sqlite {

/*
  BEGIN IMMEDIATE on the shared connection.

  The write lock is taken up front so claim and dedupe reads cannot
  interleave with another process. The connection's transaction mutex
  serializes threads in this process and is held until the transaction
  finishes.
*/
class SqliteTransaction final : public db::Transaction {
 public:
  explicit SqliteTransaction(std::shared_ptr<SqliteDB> db);
  ~SqliteTransaction() override;

  sqlite3* Handle() const {
    return db_->Handle();
  }

  void Commit() override;
  void Rollback() override;
  bool Finished() const override {
    return !guard_.owns_lock();
  }

 private:
  void RollbackQuietly();

  std::shared_ptr<SqliteDB>    db_;
  std::unique_lock<std::mutex> guard_;
};

} // namespace sandbox::db::sqlite
