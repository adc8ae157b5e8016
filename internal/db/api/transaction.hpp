#pragma once

namespace sandbox::db {

/*
  One serialized unit of repository work.

  Writes become visible to other transactions only after Commit(). A
  transaction that is destroyed while still open is rolled back. Begin()
  blocks while another write transaction is open, on every backend:
  SQLite takes BEGIN IMMEDIATE, Postgres an advisory transaction lock,
  Memory the repository mutex.

  Commit() on a finished transaction throws util::InvalidState. A failed
  Commit() leaves the transaction finished and rolled back.
*/
class Transaction {
 public:
  virtual ~Transaction() = default;

  virtual void Commit()   = 0;
  virtual void Rollback() = 0;

  virtual bool Finished() const = 0;
};

} // namespace sandbox::db
