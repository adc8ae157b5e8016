#include "pg_tx.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace sandbox::db::postgres {

namespace {

// Arbitrary key shared by all orchestrator processes.
constexpr long long kOrchestratorLockKey = 0x5a4e4442;

} // namespace

PgTransaction::PgTransaction(const std::shared_ptr<PgPool>& pool)
    : conn_(pool->Acquire()), work_(std::make_unique<pqxx::work>(*conn_)) {
  work_->exec_params("SELECT pg_advisory_xact_lock($1)", kOrchestratorLockKey);
}

PgTransaction::~PgTransaction() {
  if (finished_) return;
  try {
    work_->abort();
  } catch (const pqxx::failure& e) {
    SANDBOX_LOG_WARN("postgres rollback failed", {observability::StringField("error", e.what())});
  }
}

void PgTransaction::Commit() {
  if (finished_) throw util::InvalidState("postgres transaction already finished");
  finished_ = true;
  try {
    work_->commit();
  } catch (const pqxx::serialization_failure& e) {
    throw util::StorageError(std::string("postgres commit: ") + e.what(), true);
  } catch (const pqxx::deadlock_detected& e) {
    throw util::StorageError(std::string("postgres commit: ") + e.what(), true);
  } catch (const pqxx::in_doubt_error& e) {
    throw util::StorageError(std::string("postgres commit outcome unknown: ") + e.what());
  } catch (const pqxx::broken_connection& e) {
    throw util::StorageError(std::string("postgres commit: ") + e.what(), true);
  }
}

void PgTransaction::Rollback() {
  if (finished_) return;
  finished_ = true;
  work_->abort();
}

} // namespace sandbox::db::postgres
