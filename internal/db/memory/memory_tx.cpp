#include "memory_tx.hpp"

namespace roadcast::db::memory {

MemoryTransaction::MemoryTransaction(MemoryRepository& repo) : repo_(repo) {
}

MemoryTransaction::~MemoryTransaction() {
  RollbackIfOpen();
}

void MemoryTransaction::DoCommit() {
  std::scoped_lock lock(repo_.mutex_);
  undo_.clear();
}

void MemoryTransaction::DoRollback() {
  std::scoped_lock lock(repo_.mutex_);
  for (auto it = undo_.rbegin(); it != undo_.rend(); ++it) {
    (*it)(repo_.state_);
  }
  undo_.clear();
}

} // namespace roadcast::db::memory
