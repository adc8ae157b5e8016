#pragma once

#include <memory>
#include <pqxx/pqxx>

#include "internal/db/api/transaction.hpp"
#include "pg_pool.hpp"

namespace sandbox::db::postgres {

/*
  pqxx::work that first takes pg_advisory_xact_lock, serializing
  orchestrator writes across every process sharing the database. The
  pooled connection is returned when the transaction is destroyed.
*/
class PgTransaction final : public db::Transaction {
 public:
  explicit PgTransaction(const std::shared_ptr<PgPool>& pool);
  ~PgTransaction() override;

  pqxx::work& Work() {
    return *work_;
  }

  void Commit() override;
  void Rollback() override;
  bool Finished() const override {
    return finished_;
  }

 private:
  std::shared_ptr<pqxx::connection> conn_;
  std::unique_ptr<pqxx::work>       work_;
  bool                              finished_ = false;
};

} // namespace sandbox::db::postgres
