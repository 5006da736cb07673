#include "factory.hpp"

#include <stdexcept>

#include "internal/cache/durable_cache_layer.hpp"
#include "internal/cache/memory_cache_layer.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/graph/nearest_node_locator.hpp"
#include "internal/observability/logging.hpp"
#if ROADCAST_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif
#if ROADCAST_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace roadcast::factory {

using roadcast::observability::IntField;
using roadcast::observability::StringField;

service::ServiceContext Engine::Context() const {
  service::ServiceContext ctx;
  ctx.routes  = routes;
  ctx.weather = weather;
  ctx.trips   = trips;
  ctx.cache   = cache;
  ctx.gate    = gate;
  ctx.janitor = janitor;
  ctx.graph   = graph;
  return ctx;
}

std::shared_ptr<db::Repository> BuildRepository(const roadcast::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if ROADCAST_DB_SQLITE
    ROADCAST_LOG_INFO("using sqlite repository", {StringField("path", database.sqlite().path())});
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path());
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  if (database.has_postgres()) {
#if ROADCAST_DB_POSTGRES
    const auto max_connections = database.postgres().max_connections() > 0 ? database.postgres().max_connections() : 16;
    ROADCAST_LOG_INFO("using postgres repository", {IntField("max_connections", max_connections)});
    auto pool = std::make_shared<db::postgres::PgPool>(database.postgres().connection_uri(), max_connections);
    return std::make_shared<db::postgres::PgRepository>(std::move(pool));
#else
    throw std::runtime_error("postgres backend requested but not enabled at build time");
#endif
  }

  ROADCAST_LOG_WARN("using in-memory repository; graph and durable cache are lost on exit");
  return std::make_shared<db::memory::MemoryRepository>();
}

Providers UnconfiguredProviders() {
  Providers p;
  p.weather   = std::make_shared<providers::UnconfiguredWeatherProvider>();
  p.routing   = std::make_shared<providers::UnconfiguredRoutingProvider>();
  p.discovery = std::make_shared<providers::UnconfiguredDiscoveryProvider>();
  return p;
}

Engine BuildEngine(std::shared_ptr<db::Repository> repository, config::EngineOptions options, Providers providers) {
  Engine engine;
  engine.options    = std::move(options);
  engine.repository = std::move(repository);
  const auto& opt   = engine.options;

  // ------------------------------------------------------------------
  // Spatial + graph
  // ------------------------------------------------------------------
  engine.cells = std::make_shared<spatial::SpatialCellIndex>(opt.spatial.cell_resolution);
  engine.graph = std::make_shared<graph::RoadGraphStore>(engine.repository, std::make_shared<graph::NearestNodeLocator>(), opt.graph);
  engine.graph->Reload();

  // ------------------------------------------------------------------
  // Cache tiers
  // ------------------------------------------------------------------
  auto fast      = std::make_shared<cache::MemoryCacheLayer>(opt.cache.fast_max_entries);
  auto durable   = std::make_shared<cache::DurableCacheLayer>(engine.repository);
  engine.cache   = std::make_shared<cache::TieredCache>(fast, durable, opt.cache.route_fast_ttl);
  engine.gate    = std::make_shared<cache::DedupGate>();
  engine.janitor = std::make_shared<cache::CacheJanitor>(engine.cache, opt.cache.purge_interval, opt.cache.stale_grace);

  // ------------------------------------------------------------------
  // Coordinators
  // ------------------------------------------------------------------
  engine.weather = std::make_shared<core::WeatherSegmentCache>(engine.cells, engine.cache, engine.gate, std::move(providers.weather), opt.weather,
                                                               opt.gate, opt.cache.stale_grace);
  engine.routes  = std::make_shared<core::RouteCacheCoordinator>(engine.repository, engine.graph, engine.cache, engine.gate,
                                                                std::move(providers.routing), std::move(providers.discovery), opt);
  engine.trips   = std::make_shared<core::TripPlanner>(engine.routes, engine.weather, opt.weather);

  engine.janitor->Start();
  return engine;
}

} // namespace roadcast::factory
