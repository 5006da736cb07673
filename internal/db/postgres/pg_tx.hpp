#pragma once

#include <memory>
#include <pqxx/pqxx>

#include "internal/db/api/transaction.hpp"
#include "pg_pool.hpp"

namespace roadcast::db::postgres {

// One pooled connection and one pqxx::work for the transaction's lifetime.
class PgTransaction final : public db::Transaction {
public:
  explicit PgTransaction(std::shared_ptr<PgPool> pool);
  ~PgTransaction() override;

  pqxx::work& Work() { return *work_; }

protected:
  void DoCommit() override;
  void DoRollback() override;

private:
  // conn_ outlives work_.
  std::shared_ptr<pqxx::connection> conn_;
  std::unique_ptr<pqxx::work>       work_;
};

}
