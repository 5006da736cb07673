#include "transaction.hpp"

#include <exception>
#include <stdexcept>

#include "internal/observability/logging.hpp"

namespace roadcast::db {

void Transaction::Commit() {
  if (state_ != State::kOpen) {
    throw std::logic_error("commit on a finished transaction");
  }
  DoCommit();
  state_ = State::kCommitted;
}

void Transaction::Rollback() {
  if (state_ != State::kOpen) return;
  state_ = State::kRolledBack;
  DoRollback();
}

void Transaction::RollbackIfOpen() noexcept {
  if (state_ != State::kOpen) return;
  state_ = State::kRolledBack;
  try {
    DoRollback();
  } catch (const std::exception& e) {
    ROADCAST_LOG_WARN("rollback failed", {observability::StringField("error", e.what())});
  }
}

} // namespace roadcast::db
