#pragma once

#include <memory>
#include <mutex>

#include "internal/db/api/transaction.hpp"
#include "sqlite_db.hpp"

namespace roadcast::db::sqlite {

// BEGIN IMMEDIATE under the connection's writer mutex, held until destruction.
class SqliteTransaction final : public db::Transaction {
public:
  explicit SqliteTransaction(std::shared_ptr<SqliteDB> db);
  ~SqliteTransaction() override;

  sqlite3* Handle() const { return db_->Handle(); }

protected:
  void DoCommit() override;
  void DoRollback() override;

private:
  std::shared_ptr<SqliteDB>    db_;
  std::unique_lock<std::mutex> writer_;
};

}
