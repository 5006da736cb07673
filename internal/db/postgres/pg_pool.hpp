#pragma once

#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <pqxx/pqxx>
#include <string>
#include <vector>

namespace roadcast::db::postgres {

/*
  PgPool

  Bounded connection pool used by PgRepository.

  - libpqxx connections are not thread-safe, so each transaction holds one
    connection exclusively until it is destroyed.
  - Prepared statements for the hot lookups (cache entries, routes, nodes)
    are installed when a connection is opened.
  - Acquire() blocks once max_connections are checked out.
*/

class PgPool : public std::enable_shared_from_this<PgPool> {
 public:
  explicit PgPool(std::string conninfo, std::size_t max_connections = 16);

  std::shared_ptr<pqxx::connection> Acquire();

  // Runs the schema on a pooled connection.
  void Migrate();

 private:
  static void                       PrepareStatements(pqxx::connection& conn);
  std::shared_ptr<pqxx::connection> Wrap(pqxx::connection* conn);
  void                              Release(pqxx::connection* conn);

  std::string conninfo_;
  std::size_t max_connections_;

  std::mutex                                     mutex_;
  std::condition_variable                        cv_;
  std::vector<std::unique_ptr<pqxx::connection>> idle_;
  std::size_t                                    live_connections_ = 0;
};

} // namespace roadcast::db::postgres
