#pragma once

namespace roadcast::db {

/*
  Unit of work over one repository.

  Every backend guarantees:
  - writes become visible to other transactions only after Commit()
  - a transaction destroyed while open is rolled back
  - natural keys (place name+country, node coord_key, edge endpoints) are
    enforced at write time, so concurrent inserts converge on one row

  Backends implement DoCommit/DoRollback; state is tracked here. A failed
  DoCommit leaves the transaction open so the destructor still rolls back.
  Derived destructors call RollbackIfOpen(), since this destructor can no
  longer reach them.

  Not thread safe. Never open a second transaction on the same thread while
  one is live: the SQLite backend holds a writer mutex for the whole scope.
*/
class Transaction {
public:
  virtual ~Transaction() = default;

  // std::logic_error once committed or rolled back.
  void Commit();

  // No-op when already finished.
  void Rollback();

  bool IsOpen() const { return state_ == State::kOpen; }

protected:
  virtual void DoCommit()   = 0;
  virtual void DoRollback() = 0;

  // Logs instead of throwing; meant for destructors.
  void RollbackIfOpen() noexcept;

private:
  enum class State { kOpen, kCommitted, kRolledBack };
  State state_ = State::kOpen;
};

}
