#pragma once

#include <functional>
#include <vector>

#include "internal/db/api/transaction.hpp"
#include "memory_repository.hpp"

namespace roadcast::db::memory {

/*
  Writes are applied to the shared state immediately; each one records an
  undo step. Rollback replays them newest first. Other readers can see
  uncommitted writes, which is acceptable for tests and single-node use.
*/
class MemoryTransaction final : public db::Transaction {
 public:
  using Undo = std::function<void(MemoryRepository::State&)>;

  explicit MemoryTransaction(MemoryRepository& repo);
  ~MemoryTransaction() override;

  // Caller holds the repository mutex.
  void Record(Undo undo) {
    undo_.push_back(std::move(undo));
  }

 protected:
  void DoCommit() override;
  void DoRollback() override;

 private:
  MemoryRepository& repo_;
  std::vector<Undo> undo_;
};

} // namespace roadcast::db::memory
