#include "pg_tx.hpp"

namespace roadcast::db::postgres {

PgTransaction::PgTransaction(std::shared_ptr<PgPool> pool)
    : conn_(pool->Acquire()), work_(std::make_unique<pqxx::work>(*conn_)) {
}

PgTransaction::~PgTransaction() {
  RollbackIfOpen();
}

void PgTransaction::DoCommit() {
  work_->commit();
}

void PgTransaction::DoRollback() {
  work_->abort();
}

}
