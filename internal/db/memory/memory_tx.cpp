#include "memory_tx.hpp"

#include "internal/util/errors.hpp"

namespace sandbox::db::memory {

MemoryTransaction::MemoryTransaction(MemoryRepository& repo)
    : repo_(repo), lock_(repo.mutex_), working_(repo.committed_) {}

MemoryTransaction::~MemoryTransaction() {
  Rollback();
}

void MemoryTransaction::Commit() {
  if (Finished()) throw util::InvalidState("memory transaction already finished");
  repo_.committed_ = std::move(working_);
  lock_.unlock();
}

void MemoryTransaction::Rollback() {
  if (lock_.owns_lock()) lock_.unlock();
}

} // namespace sandbox::db::memory
