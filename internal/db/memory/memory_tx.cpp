#include "memory_tx.hpp"

#include "internal/util/errors.hpp"

namespace jobq::db::memory {

MemoryTransaction::MemoryTransaction(MemoryRepository& repo)
    : repo_(repo), lock_(repo.writer_mutex_, std::defer_lock) {
  if (!lock_.try_lock_for(repo_.busy_timeout_)) {
    throw util::StoreError(ErrorCode::Busy, "memory store: timed out waiting for writer lock");
  }
  working_ = repo_.committed_; // snapshot copy
}

void MemoryTransaction::Commit() {
  if (!lock_.owns_lock()) {
    throw util::StoreError(ErrorCode::InternalError, "memory store: transaction already finished");
  }
  repo_.committed_ = std::move(working_);
  committed_       = true;
  lock_.unlock();
}

void MemoryTransaction::Rollback() {
  if (lock_.owns_lock()) lock_.unlock();
}

} // namespace jobq::db::memory
