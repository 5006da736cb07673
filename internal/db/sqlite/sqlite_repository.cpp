#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <functional>
#include <stdexcept>

#include "internal/db/sql/migrations.hpp"

namespace roadcast::db::sqlite {

using roadcast::db::ErrorCode;
using roadcast::db::Result;

namespace {

// Finalizes on scope exit.
class Statement {
 public:
  Statement(sqlite3* db, const char* sql) : db_(db) {
    if (sqlite3_prepare_v2(db, sql, -1, &stmt_, nullptr) != SQLITE_OK) {
      stmt_ = nullptr;
    }
  }
  ~Statement() {
    if (stmt_) sqlite3_finalize(stmt_);
  }

  Statement(const Statement&)            = delete;
  Statement& operator=(const Statement&) = delete;

  explicit operator bool() const {
    return stmt_ != nullptr;
  }
  sqlite3_stmt* get() const {
    return stmt_;
  }

  // For reads: a failed prepare is a broken schema, not an empty result.
  sqlite3_stmt* OrThrow() const {
    if (!stmt_) throw std::runtime_error(std::string("sqlite prepare: ") + sqlite3_errmsg(db_));
    return stmt_;
  }

 private:
  sqlite3*      db_;
  sqlite3_stmt* stmt_ = nullptr;
};

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

void BindI64(sqlite3_stmt* st, int idx, std::int64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindReal(sqlite3_stmt* st, int idx, double v) {
  sqlite3_bind_double(st, idx, v);
}

std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

std::int64_t ColI64(sqlite3_stmt* st, int col) {
  return static_cast<std::int64_t>(sqlite3_column_int64(st, col));
}

double ColReal(sqlite3_stmt* st, int col) {
  return sqlite3_column_double(st, col);
}

constexpr const char* kPlaceColumns = "SELECT place_id,name,place_type,region,lat,lon,time_zone,metadata,created_at_ms FROM places ";
constexpr const char* kNodeColumns  = "SELECT node_id,lat,lon,coord_key,linked_place_id,node_type,label FROM nodes ";
constexpr const char* kEdgeColumns =
    "SELECT edge_id,source_node,target_node,distance_m,max_speed_kmh,duration_s,geometry,road_type,road_name FROM edges ";

model::PlaceRecord ReadPlace(sqlite3_stmt* st) {
  model::PlaceRecord r;
  r.id            = ColI64(st, 0);
  r.name          = ColText(st, 1);
  r.place_type    = ColText(st, 2);
  r.region        = ColText(st, 3);
  r.lat           = ColReal(st, 4);
  r.lon           = ColReal(st, 5);
  r.time_zone     = ColText(st, 6);
  r.metadata_json = ColText(st, 7);
  r.created_at_ms = ColI64(st, 8);
  return r;
}

model::NodeRecord ReadNode(sqlite3_stmt* st) {
  model::NodeRecord r;
  r.id        = ColI64(st, 0);
  r.lat       = ColReal(st, 1);
  r.lon       = ColReal(st, 2);
  r.coord_key = ColText(st, 3);
  if (sqlite3_column_type(st, 4) != SQLITE_NULL) r.linked_place_id = ColI64(st, 4);
  r.node_type = ColText(st, 5);
  r.label     = ColText(st, 6);
  return r;
}

model::EdgeRecord ReadEdge(sqlite3_stmt* st) {
  model::EdgeRecord r;
  r.id            = ColI64(st, 0);
  r.source_node   = ColI64(st, 1);
  r.target_node   = ColI64(st, 2);
  r.distance_m    = ColReal(st, 3);
  r.max_speed_kmh = ColReal(st, 4);
  r.duration_s    = ColReal(st, 5);
  r.geometry_wkt  = ColText(st, 6);
  r.road_type     = ColText(st, 7);
  r.road_name     = ColText(st, 8);
  return r;
}

class SqliteMigrationExecutor final : public sql::MigrationExecutor {
 public:
  explicit SqliteMigrationExecutor(SqliteDB& db) : db_(db) {
  }
  void ExecuteSQL(const std::string& sql) override {
    db_.Exec(sql);
  }

 private:
  SqliteDB& db_;
};

std::optional<std::int64_t> SelectId(sqlite3* db, const char* sql, const std::function<void(sqlite3_stmt*)>& bind) {
  Statement st(db, sql);
  bind(st.OrThrow());
  if (sqlite3_step(st.get()) != SQLITE_ROW) return std::nullopt;
  return ColI64(st.get(), 0);
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
  std::lock_guard<std::mutex> lock(db_->WriterMutex());
  SqliteMigrationExecutor     executor(*db_);
  sql::RunMigrations(executor, sql::SqliteSchema());
}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
  return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
  return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW) return Result::Ok();

  switch (rc & 0xFF) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
    case SQLITE_CONSTRAINT:
      return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
    case SQLITE_IOERR:
      return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
    case SQLITE_CORRUPT:
      return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
    default:
      return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
}

// ------------------------------------------------------------------
// Places
// ------------------------------------------------------------------

Result SqliteRepository::UpsertPlace(Transaction& t, model::PlaceRecord& r) {
  auto* db = TX(t).Handle();

  Statement st(db,
               "INSERT INTO places(name,place_type,region,lat,lon,time_zone,metadata,created_at_ms) VALUES(?,?,?,?,?,?,?,?) "
               "ON CONFLICT(name,place_type,region) DO NOTHING;");
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.get(), 1, r.name);
  BindText(st.get(), 2, r.place_type);
  BindText(st.get(), 3, r.region);
  BindReal(st.get(), 4, r.lat);
  BindReal(st.get(), 5, r.lon);
  BindText(st.get(), 6, r.time_zone);
  BindText(st.get(), 7, r.metadata_json.empty() ? "{}" : r.metadata_json);
  BindI64(st.get(), 8, r.created_at_ms);

  auto result = Translate(db, sqlite3_step(st.get()));
  if (!result) return result;

  auto id = SelectId(db, "SELECT place_id FROM places WHERE name=? AND place_type=? AND region=?;", [&](sqlite3_stmt* q) {
    BindText(q, 1, r.name);
    BindText(q, 2, r.place_type);
    BindText(q, 3, r.region);
  });
  if (!id) return Result::Err(ErrorCode::InternalError, "place vanished after upsert");
  r.id = *id;
  return Result::Ok();
}

std::optional<model::PlaceRecord> SqliteRepository::GetPlace(Transaction& t, std::int64_t id) {
  Statement st(TX(t).Handle(), (std::string(kPlaceColumns) + "WHERE place_id=?;").c_str());
  BindI64(st.OrThrow(), 1, id);
  if (sqlite3_step(st.get()) != SQLITE_ROW) return std::nullopt;
  return ReadPlace(st.get());
}

std::optional<model::PlaceRecord> SqliteRepository::FindPlace(Transaction& t, const std::string& name, const std::string& place_type,
                                                              const std::string& region) {
  Statement st(TX(t).Handle(), (std::string(kPlaceColumns) + "WHERE name=? AND place_type=? AND region=?;").c_str());
  BindText(st.OrThrow(), 1, name);
  BindText(st.get(), 2, place_type);
  BindText(st.get(), 3, region);
  if (sqlite3_step(st.get()) != SQLITE_ROW) return std::nullopt;
  return ReadPlace(st.get());
}

std::vector<model::PlaceRecord> SqliteRepository::ListPlaces(Transaction& t) {
  Statement                       st(TX(t).Handle(), (std::string(kPlaceColumns) + "ORDER BY place_id;").c_str());
  std::vector<model::PlaceRecord> out;
  st.OrThrow();
  while (sqlite3_step(st.get()) == SQLITE_ROW) {
    out.push_back(ReadPlace(st.get()));
  }
  return out;
}

// ------------------------------------------------------------------
// Nodes
// ------------------------------------------------------------------

Result SqliteRepository::InsertNode(Transaction& t, model::NodeRecord& r) {
  auto* db = TX(t).Handle();

  Statement st(db,
               "INSERT INTO nodes(lat,lon,coord_key,linked_place_id,node_type,label) VALUES(?,?,?,?,?,?) "
               "ON CONFLICT(coord_key) DO NOTHING;");
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindReal(st.get(), 1, r.lat);
  BindReal(st.get(), 2, r.lon);
  BindText(st.get(), 3, r.coord_key);
  if (r.linked_place_id) {
    BindI64(st.get(), 4, *r.linked_place_id);
  } else {
    sqlite3_bind_null(st.get(), 4);
  }
  BindText(st.get(), 5, r.node_type);
  BindText(st.get(), 6, r.label);

  auto result = Translate(db, sqlite3_step(st.get()));
  if (!result) return result;

  auto id = SelectId(db, "SELECT node_id FROM nodes WHERE coord_key=?;", [&](sqlite3_stmt* q) { BindText(q, 1, r.coord_key); });
  if (!id) return Result::Err(ErrorCode::InternalError, "node vanished after insert");
  r.id = *id;
  return Result::Ok();
}

Result SqliteRepository::LinkNodeToPlace(Transaction& t, std::int64_t node_id, std::int64_t place_id) {
  auto* db = TX(t).Handle();

  Statement st(db, "UPDATE nodes SET linked_place_id=?, node_type='access_point' WHERE node_id=? AND linked_place_id IS NULL;");
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  BindI64(st.get(), 1, place_id);
  BindI64(st.get(), 2, node_id);

  auto result = Translate(db, sqlite3_step(st.get()));
  if (!result) return result;
  if (sqlite3_changes(db) > 0) return Result::Ok();

  auto node = GetNode(t, node_id);
  if (!node) return Result::Err(ErrorCode::NotFound, "node not found");
  if (node->linked_place_id == place_id) return Result::Ok();
  return Result::Err(ErrorCode::ConstraintViolation,
                     "node " + std::to_string(node_id) + " already linked to place " + std::to_string(node->linked_place_id.value_or(0)));
}

std::optional<model::NodeRecord> SqliteRepository::GetNode(Transaction& t, std::int64_t id) {
  Statement st(TX(t).Handle(), (std::string(kNodeColumns) + "WHERE node_id=?;").c_str());
  BindI64(st.OrThrow(), 1, id);
  if (sqlite3_step(st.get()) != SQLITE_ROW) return std::nullopt;
  return ReadNode(st.get());
}

std::vector<model::NodeRecord> SqliteRepository::ListNodes(Transaction& t) {
  Statement                      st(TX(t).Handle(), (std::string(kNodeColumns) + "ORDER BY node_id;").c_str());
  std::vector<model::NodeRecord> out;
  st.OrThrow();
  while (sqlite3_step(st.get()) == SQLITE_ROW) {
    out.push_back(ReadNode(st.get()));
  }
  return out;
}

// ------------------------------------------------------------------
// Edges
// ------------------------------------------------------------------

Result SqliteRepository::UpsertEdge(Transaction& t, model::EdgeRecord& r) {
  auto* db = TX(t).Handle();

  Statement st(db,
               "INSERT INTO edges(source_node,target_node,distance_m,max_speed_kmh,duration_s,geometry,road_type,road_name) "
               "VALUES(?,?,?,?,?,?,?,?) ON CONFLICT(source_node,target_node) DO NOTHING;");
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindI64(st.get(), 1, r.source_node);
  BindI64(st.get(), 2, r.target_node);
  BindReal(st.get(), 3, r.distance_m);
  BindReal(st.get(), 4, r.max_speed_kmh);
  BindReal(st.get(), 5, r.duration_s);
  BindText(st.get(), 6, r.geometry_wkt);
  BindText(st.get(), 7, r.road_type);
  BindText(st.get(), 8, r.road_name);

  auto result = Translate(db, sqlite3_step(st.get()));
  if (!result) return result;

  auto id = SelectId(db, "SELECT edge_id FROM edges WHERE source_node=? AND target_node=?;", [&](sqlite3_stmt* q) {
    BindI64(q, 1, r.source_node);
    BindI64(q, 2, r.target_node);
  });
  if (!id) return Result::Err(ErrorCode::InternalError, "edge vanished after upsert");
  r.id = *id;
  return Result::Ok();
}

std::optional<model::EdgeRecord> SqliteRepository::GetEdge(Transaction& t, std::int64_t source_node, std::int64_t target_node) {
  Statement st(TX(t).Handle(), (std::string(kEdgeColumns) + "WHERE source_node=? AND target_node=?;").c_str());
  BindI64(st.OrThrow(), 1, source_node);
  BindI64(st.get(), 2, target_node);
  if (sqlite3_step(st.get()) != SQLITE_ROW) return std::nullopt;
  return ReadEdge(st.get());
}

std::vector<model::EdgeRecord> SqliteRepository::ListEdges(Transaction& t) {
  Statement                      st(TX(t).Handle(), (std::string(kEdgeColumns) + "ORDER BY edge_id;").c_str());
  std::vector<model::EdgeRecord> out;
  st.OrThrow();
  while (sqlite3_step(st.get()) == SQLITE_ROW) {
    out.push_back(ReadEdge(st.get()));
  }
  return out;
}

model::GraphCounts SqliteRepository::CountGraph(Transaction& t) {
  Statement st(TX(t).Handle(),
               "SELECT (SELECT COUNT(*) FROM places), (SELECT COUNT(*) FROM nodes), "
               "(SELECT COUNT(*) FROM nodes WHERE node_type='access_point'), (SELECT COUNT(*) FROM edges);");
  model::GraphCounts counts;
  if (sqlite3_step(st.OrThrow()) == SQLITE_ROW) {
    counts.places        = static_cast<std::uint64_t>(ColI64(st.get(), 0));
    counts.nodes         = static_cast<std::uint64_t>(ColI64(st.get(), 1));
    counts.access_points = static_cast<std::uint64_t>(ColI64(st.get(), 2));
    counts.edges         = static_cast<std::uint64_t>(ColI64(st.get(), 3));
  }
  return counts;
}

// ------------------------------------------------------------------
// Routes
// ------------------------------------------------------------------

Result SqliteRepository::UpsertRoute(Transaction& t, const model::RouteRow& r) {
  auto* db = TX(t).Handle();

  Statement st(db,
               "INSERT INTO routes(source_place_id,target_place_id,payload,distance_km,duration_hours,created_at_ms) VALUES(?,?,?,?,?,?) "
               "ON CONFLICT(source_place_id,target_place_id) DO UPDATE SET payload=excluded.payload, distance_km=excluded.distance_km, "
               "duration_hours=excluded.duration_hours, created_at_ms=excluded.created_at_ms;");
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindI64(st.get(), 1, r.source_place_id);
  BindI64(st.get(), 2, r.target_place_id);
  BindText(st.get(), 3, r.payload_json);
  BindReal(st.get(), 4, r.distance_km);
  BindReal(st.get(), 5, r.duration_hours);
  BindI64(st.get(), 6, r.created_at_ms);

  return Translate(db, sqlite3_step(st.get()));
}

std::optional<model::RouteRow> SqliteRepository::GetRoute(Transaction& t, std::int64_t source_place_id, std::int64_t target_place_id) {
  Statement st(TX(t).Handle(),
               "SELECT route_id,source_place_id,target_place_id,payload,distance_km,duration_hours,created_at_ms FROM routes "
               "WHERE source_place_id=? AND target_place_id=?;");
  BindI64(st.OrThrow(), 1, source_place_id);
  BindI64(st.get(), 2, target_place_id);
  if (sqlite3_step(st.get()) != SQLITE_ROW) return std::nullopt;

  model::RouteRow r;
  r.id              = ColI64(st.get(), 0);
  r.source_place_id = ColI64(st.get(), 1);
  r.target_place_id = ColI64(st.get(), 2);
  r.payload_json    = ColText(st.get(), 3);
  r.distance_km     = ColReal(st.get(), 4);
  r.duration_hours  = ColReal(st.get(), 5);
  r.created_at_ms   = ColI64(st.get(), 6);
  return r;
}

Result SqliteRepository::DeleteRoute(Transaction& t, std::int64_t source_place_id, std::int64_t target_place_id) {
  auto*     db = TX(t).Handle();
  Statement st(db, "DELETE FROM routes WHERE source_place_id=? AND target_place_id=?;");
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  BindI64(st.get(), 1, source_place_id);
  BindI64(st.get(), 2, target_place_id);

  auto result = Translate(db, sqlite3_step(st.get()));
  if (!result) return result;
  return sqlite3_changes(db) > 0 ? Result::Ok() : Result::Err(ErrorCode::NotFound);
}

// ------------------------------------------------------------------
// Cache entries
// ------------------------------------------------------------------

Result SqliteRepository::UpsertCacheEntry(Transaction& t, const model::CacheEntryRecord& r) {
  auto* db = TX(t).Handle();

  Statement st(db,
               "INSERT INTO cache_entries(key,payload,created_at_ms,expires_at_ms,generation) VALUES(?,?,?,?,?) "
               "ON CONFLICT(key) DO UPDATE SET payload=excluded.payload, created_at_ms=excluded.created_at_ms, "
               "expires_at_ms=excluded.expires_at_ms, generation=excluded.generation;");
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.get(), 1, r.key);
  BindText(st.get(), 2, r.payload);
  BindI64(st.get(), 3, r.created_at_ms);
  BindI64(st.get(), 4, r.expires_at_ms);
  BindText(st.get(), 5, r.generation);

  return Translate(db, sqlite3_step(st.get()));
}

std::optional<model::CacheEntryRecord> SqliteRepository::GetCacheEntry(Transaction& t, const std::string& key) {
  Statement st(TX(t).Handle(), "SELECT key,payload,created_at_ms,expires_at_ms,generation FROM cache_entries WHERE key=?;");
  BindText(st.OrThrow(), 1, key);
  if (sqlite3_step(st.get()) != SQLITE_ROW) return std::nullopt;

  model::CacheEntryRecord r;
  r.key           = ColText(st.get(), 0);
  r.payload       = ColText(st.get(), 1);
  r.created_at_ms = ColI64(st.get(), 2);
  r.expires_at_ms = ColI64(st.get(), 3);
  r.generation    = ColText(st.get(), 4);
  return r;
}

Result SqliteRepository::DeleteCacheEntry(Transaction& t, const std::string& key) {
  auto*     db = TX(t).Handle();
  Statement st(db, "DELETE FROM cache_entries WHERE key=?;");
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  BindText(st.get(), 1, key);

  auto result = Translate(db, sqlite3_step(st.get()));
  if (!result) return result;
  return sqlite3_changes(db) > 0 ? Result::Ok() : Result::Err(ErrorCode::NotFound);
}

Result SqliteRepository::DeleteCacheEntriesExpiredBefore(Transaction& t, std::int64_t cutoff_ms, std::uint64_t& removed) {
  auto*     db = TX(t).Handle();
  Statement st(db, "DELETE FROM cache_entries WHERE expires_at_ms<=?;");
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  BindI64(st.get(), 1, cutoff_ms);

  auto result = Translate(db, sqlite3_step(st.get()));
  removed     = result ? static_cast<std::uint64_t>(sqlite3_changes(db)) : 0;
  return result;
}

} // namespace roadcast::db::sqlite
