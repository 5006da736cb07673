#include "pg_pool.hpp"

#include "internal/db/sql/migrations.hpp"

namespace roadcast::db::postgres {

namespace {

class PgMigrationExecutor final : public sql::MigrationExecutor {
 public:
  explicit PgMigrationExecutor(pqxx::work& work) : work_(work) {
  }
  void ExecuteSQL(const std::string& statement) override {
    work_.exec(statement);
  }

 private:
  pqxx::work& work_;
};

} // namespace

PgPool::PgPool(std::string conninfo, std::size_t max_connections)
    : conninfo_(std::move(conninfo)), max_connections_(max_connections == 0 ? 1 : max_connections) {
}

std::shared_ptr<pqxx::connection> PgPool::Acquire() {
  std::unique_lock lock(mutex_);
  cv_.wait(lock, [this] { return !idle_.empty() || live_connections_ < max_connections_; });

  if (!idle_.empty()) {
    auto conn = std::move(idle_.back());
    idle_.pop_back();
    return Wrap(conn.release());
  }

  ++live_connections_;
  lock.unlock();

  try {
    auto conn = std::make_unique<pqxx::connection>(conninfo_);
    PrepareStatements(*conn);
    return Wrap(conn.release());
  } catch (const std::exception&) {
    std::lock_guard rollback_lock(mutex_);
    --live_connections_;
    cv_.notify_one();
    throw;
  }
}

void PgPool::Migrate() {
  auto       conn = Acquire();
  pqxx::work work(*conn);

  // Serializes concurrent start-ups racing on CREATE TABLE IF NOT EXISTS.
  work.exec("SELECT pg_advisory_xact_lock(7261001);");

  PgMigrationExecutor executor(work);
  sql::RunMigrations(executor, sql::PostgresSchema());
  work.commit();
}

void PgPool::PrepareStatements(pqxx::connection& conn) {
  conn.prepare("get_cache_entry", "SELECT key,payload,created_at_ms,expires_at_ms,generation FROM cache_entries WHERE key=$1");

  conn.prepare("upsert_cache_entry",
               "INSERT INTO cache_entries(key,payload,created_at_ms,expires_at_ms,generation) VALUES($1,$2,$3,$4,$5) "
               "ON CONFLICT(key) DO UPDATE SET payload=EXCLUDED.payload,created_at_ms=EXCLUDED.created_at_ms,"
               "expires_at_ms=EXCLUDED.expires_at_ms,generation=EXCLUDED.generation");

  conn.prepare("get_route",
               "SELECT route_id,source_place_id,target_place_id,payload::text,distance_km,duration_hours,created_at_ms "
               "FROM routes WHERE source_place_id=$1 AND target_place_id=$2");

  conn.prepare("get_node", "SELECT node_id,lat,lon,coord_key,linked_place_id,node_type,label FROM nodes WHERE node_id=$1");
}

std::shared_ptr<pqxx::connection> PgPool::Wrap(pqxx::connection* conn) {
  std::weak_ptr<PgPool> weak_self = shared_from_this();
  return std::shared_ptr<pqxx::connection>(conn, [weak_self](pqxx::connection* released_conn) {
    if (auto self = weak_self.lock()) {
      self->Release(released_conn);
      return;
    }
    delete released_conn;
  });
}

void PgPool::Release(pqxx::connection* conn) {
  {
    std::lock_guard lock(mutex_);
    if (!conn->is_open()) {
      --live_connections_;
      delete conn;
    } else {
      idle_.emplace_back(conn);
    }
  }
  cv_.notify_one();
}

} // namespace roadcast::db::postgres
