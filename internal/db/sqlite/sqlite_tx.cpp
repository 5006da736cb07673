#include "sqlite_tx.hpp"

namespace roadcast::db::sqlite {

SqliteTransaction::SqliteTransaction(std::shared_ptr<SqliteDB> db) : db_(std::move(db)), writer_(db_->WriterMutex()) {
  db_->Exec("BEGIN IMMEDIATE;");
}

SqliteTransaction::~SqliteTransaction() {
  RollbackIfOpen();
}

void SqliteTransaction::DoCommit() {
  db_->Exec("COMMIT;");
}

void SqliteTransaction::DoRollback() {
  db_->Exec("ROLLBACK;");
}

} // namespace roadcast::db::sqlite
