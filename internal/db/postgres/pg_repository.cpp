#include "pg_repository.hpp"

namespace roadcast::db::postgres {

namespace {

constexpr const char* kPlaceSelect =
    "SELECT place_id,name,place_type,region,lat,lon,time_zone,metadata::text,created_at_ms FROM places ";
constexpr const char* kNodeSelect = "SELECT node_id,lat,lon,coord_key,linked_place_id,node_type,label FROM nodes ";
constexpr const char* kEdgeSelect =
    "SELECT edge_id,source_node,target_node,distance_m,max_speed_kmh,duration_s,geometry,road_type,road_name FROM edges ";

model::PlaceRecord ReadPlace(const pqxx::row& row) {
  model::PlaceRecord r;
  r.id            = row[0].as<std::int64_t>();
  r.name          = row[1].c_str();
  r.place_type    = row[2].c_str();
  r.region        = row[3].c_str();
  r.lat           = row[4].as<double>();
  r.lon           = row[5].as<double>();
  r.time_zone     = row[6].c_str();
  r.metadata_json = row[7].c_str();
  r.created_at_ms = row[8].as<std::int64_t>();
  return r;
}

model::NodeRecord ReadNode(const pqxx::row& row) {
  model::NodeRecord r;
  r.id        = row[0].as<std::int64_t>();
  r.lat       = row[1].as<double>();
  r.lon       = row[2].as<double>();
  r.coord_key = row[3].c_str();
  if (!row[4].is_null()) r.linked_place_id = row[4].as<std::int64_t>();
  r.node_type = row[5].c_str();
  r.label     = row[6].c_str();
  return r;
}

model::EdgeRecord ReadEdge(const pqxx::row& row) {
  model::EdgeRecord r;
  r.id            = row[0].as<std::int64_t>();
  r.source_node   = row[1].as<std::int64_t>();
  r.target_node   = row[2].as<std::int64_t>();
  r.distance_m    = row[3].as<double>();
  r.max_speed_kmh = row[4].as<double>();
  r.duration_s    = row[5].as<double>();
  r.geometry_wkt  = row[6].c_str();
  r.road_type     = row[7].c_str();
  r.road_name     = row[8].c_str();
  return r;
}

} // namespace

PgRepository::PgRepository(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
  pool_->Migrate();
}

std::unique_ptr<db::Transaction> PgRepository::Begin() {
  return std::make_unique<PgTransaction>(pool_);
}

PgTransaction& PgRepository::TX(Transaction& t) {
  return static_cast<PgTransaction&>(t);
}

Result PgRepository::Translate(const std::exception& e) {
  if (dynamic_cast<const pqxx::integrity_constraint_violation*>(&e)) {
    return Result::Err(ErrorCode::ConstraintViolation, e.what());
  }
  if (dynamic_cast<const pqxx::serialization_failure*>(&e) || dynamic_cast<const pqxx::deadlock_detected*>(&e)) {
    return Result::Err(ErrorCode::SerializationFailure, e.what());
  }
  if (dynamic_cast<const pqxx::broken_connection*>(&e)) {
    return Result::Err(ErrorCode::IOError, e.what());
  }
  return Result::Err(ErrorCode::InternalError, e.what());
}

// ------------------------------------------------------------------
// Places
// ------------------------------------------------------------------

Result PgRepository::UpsertPlace(Transaction& t, model::PlaceRecord& r) {
  try {
    auto& work = TX(t).Work();
    work.exec_params(
        "INSERT INTO places(name,place_type,region,lat,lon,time_zone,metadata,created_at_ms) VALUES($1,$2,$3,$4,$5,$6,$7::jsonb,$8) "
        "ON CONFLICT(name,place_type,region) DO NOTHING;",
        r.name, r.place_type, r.region, r.lat, r.lon, r.time_zone, r.metadata_json.empty() ? std::string("{}") : r.metadata_json,
        r.created_at_ms);

    auto res = work.exec_params("SELECT place_id FROM places WHERE name=$1 AND place_type=$2 AND region=$3;", r.name, r.place_type, r.region);
    if (res.empty()) return Result::Err(ErrorCode::InternalError, "place vanished after upsert");
    r.id = res[0][0].as<std::int64_t>();
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::PlaceRecord> PgRepository::GetPlace(Transaction& t, std::int64_t id) {
  auto res = TX(t).Work().exec_params(std::string(kPlaceSelect) + "WHERE place_id=$1;", id);
  if (res.empty()) return std::nullopt;
  return ReadPlace(res[0]);
}

std::optional<model::PlaceRecord> PgRepository::FindPlace(Transaction& t, const std::string& name, const std::string& place_type,
                                                          const std::string& region) {
  auto res = TX(t).Work().exec_params(std::string(kPlaceSelect) + "WHERE name=$1 AND place_type=$2 AND region=$3;", name, place_type, region);
  if (res.empty()) return std::nullopt;
  return ReadPlace(res[0]);
}

std::vector<model::PlaceRecord> PgRepository::ListPlaces(Transaction& t) {
  auto res = TX(t).Work().exec(std::string(kPlaceSelect) + "ORDER BY place_id;");

  std::vector<model::PlaceRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    out.push_back(ReadPlace(row));
  }
  return out;
}

// ------------------------------------------------------------------
// Nodes
// ------------------------------------------------------------------

Result PgRepository::InsertNode(Transaction& t, model::NodeRecord& r) {
  try {
    auto& work = TX(t).Work();
    auto  res  = work.exec_params(
        "INSERT INTO nodes(lat,lon,coord_key,linked_place_id,node_type,label) VALUES($1,$2,$3,$4,$5,$6) "
          "ON CONFLICT(coord_key) DO NOTHING RETURNING node_id;",
        r.lat, r.lon, r.coord_key, r.linked_place_id, r.node_type, r.label);

    if (res.empty()) {
      res = work.exec_params("SELECT node_id FROM nodes WHERE coord_key=$1;", r.coord_key);
      if (res.empty()) return Result::Err(ErrorCode::InternalError, "node vanished after insert");
    }
    r.id = res[0][0].as<std::int64_t>();
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::LinkNodeToPlace(Transaction& t, std::int64_t node_id, std::int64_t place_id) {
  try {
    auto& work = TX(t).Work();
    auto  res  = work.exec_params(
        "UPDATE nodes SET linked_place_id=$1, node_type='access_point' WHERE node_id=$2 AND linked_place_id IS NULL;", place_id, node_id);
    if (res.affected_rows() > 0) return Result::Ok();

    auto node = GetNode(t, node_id);
    if (!node) return Result::Err(ErrorCode::NotFound, "node not found");
    if (node->linked_place_id == place_id) return Result::Ok();
    return Result::Err(ErrorCode::ConstraintViolation,
                       "node " + std::to_string(node_id) + " already linked to place " + std::to_string(node->linked_place_id.value_or(0)));
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::NodeRecord> PgRepository::GetNode(Transaction& t, std::int64_t id) {
  auto res = TX(t).Work().exec_prepared("get_node", id);
  if (res.empty()) return std::nullopt;
  return ReadNode(res[0]);
}

std::vector<model::NodeRecord> PgRepository::ListNodes(Transaction& t) {
  auto res = TX(t).Work().exec(std::string(kNodeSelect) + "ORDER BY node_id;");

  std::vector<model::NodeRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    out.push_back(ReadNode(row));
  }
  return out;
}

// ------------------------------------------------------------------
// Edges
// ------------------------------------------------------------------

Result PgRepository::UpsertEdge(Transaction& t, model::EdgeRecord& r) {
  try {
    auto& work = TX(t).Work();
    auto  res  = work.exec_params(
        "INSERT INTO edges(source_node,target_node,distance_m,max_speed_kmh,duration_s,geometry,road_type,road_name) "
          "VALUES($1,$2,$3,$4,$5,$6,$7,$8) ON CONFLICT(source_node,target_node) DO NOTHING RETURNING edge_id;",
        r.source_node, r.target_node, r.distance_m, r.max_speed_kmh, r.duration_s, r.geometry_wkt, r.road_type, r.road_name);

    if (res.empty()) {
      res = work.exec_params("SELECT edge_id FROM edges WHERE source_node=$1 AND target_node=$2;", r.source_node, r.target_node);
      if (res.empty()) return Result::Err(ErrorCode::InternalError, "edge vanished after upsert");
    }
    r.id = res[0][0].as<std::int64_t>();
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::EdgeRecord> PgRepository::GetEdge(Transaction& t, std::int64_t source_node, std::int64_t target_node) {
  auto res = TX(t).Work().exec_params(std::string(kEdgeSelect) + "WHERE source_node=$1 AND target_node=$2;", source_node, target_node);
  if (res.empty()) return std::nullopt;
  return ReadEdge(res[0]);
}

std::vector<model::EdgeRecord> PgRepository::ListEdges(Transaction& t) {
  auto res = TX(t).Work().exec(std::string(kEdgeSelect) + "ORDER BY edge_id;");

  std::vector<model::EdgeRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    out.push_back(ReadEdge(row));
  }
  return out;
}

model::GraphCounts PgRepository::CountGraph(Transaction& t) {
  auto res = TX(t).Work().exec(
      "SELECT (SELECT COUNT(*) FROM places), (SELECT COUNT(*) FROM nodes), "
      "(SELECT COUNT(*) FROM nodes WHERE node_type='access_point'), (SELECT COUNT(*) FROM edges);");

  model::GraphCounts counts;
  if (!res.empty()) {
    counts.places        = res[0][0].as<std::uint64_t>();
    counts.nodes         = res[0][1].as<std::uint64_t>();
    counts.access_points = res[0][2].as<std::uint64_t>();
    counts.edges         = res[0][3].as<std::uint64_t>();
  }
  return counts;
}

// ------------------------------------------------------------------
// Routes
// ------------------------------------------------------------------

Result PgRepository::UpsertRoute(Transaction& t, const model::RouteRow& r) {
  try {
    TX(t).Work().exec_params(
        "INSERT INTO routes(source_place_id,target_place_id,payload,distance_km,duration_hours,created_at_ms) VALUES($1,$2,$3::jsonb,$4,$5,$6) "
        "ON CONFLICT(source_place_id,target_place_id) DO UPDATE SET payload=EXCLUDED.payload,distance_km=EXCLUDED.distance_km,"
        "duration_hours=EXCLUDED.duration_hours,created_at_ms=EXCLUDED.created_at_ms;",
        r.source_place_id, r.target_place_id, r.payload_json, r.distance_km, r.duration_hours, r.created_at_ms);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::RouteRow> PgRepository::GetRoute(Transaction& t, std::int64_t source_place_id, std::int64_t target_place_id) {
  auto res = TX(t).Work().exec_prepared("get_route", source_place_id, target_place_id);
  if (res.empty()) return std::nullopt;

  model::RouteRow r;
  r.id              = res[0][0].as<std::int64_t>();
  r.source_place_id = res[0][1].as<std::int64_t>();
  r.target_place_id = res[0][2].as<std::int64_t>();
  r.payload_json    = res[0][3].c_str();
  r.distance_km     = res[0][4].as<double>();
  r.duration_hours  = res[0][5].as<double>();
  r.created_at_ms   = res[0][6].as<std::int64_t>();
  return r;
}

Result PgRepository::DeleteRoute(Transaction& t, std::int64_t source_place_id, std::int64_t target_place_id) {
  try {
    auto res = TX(t).Work().exec_params("DELETE FROM routes WHERE source_place_id=$1 AND target_place_id=$2;", source_place_id, target_place_id);
    return res.affected_rows() > 0 ? Result::Ok() : Result::Err(ErrorCode::NotFound);
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

// ------------------------------------------------------------------
// Cache entries
// ------------------------------------------------------------------

Result PgRepository::UpsertCacheEntry(Transaction& t, const model::CacheEntryRecord& r) {
  try {
    TX(t).Work().exec_prepared("upsert_cache_entry", r.key, r.payload, r.created_at_ms, r.expires_at_ms, r.generation);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::CacheEntryRecord> PgRepository::GetCacheEntry(Transaction& t, const std::string& key) {
  auto res = TX(t).Work().exec_prepared("get_cache_entry", key);
  if (res.empty()) return std::nullopt;

  model::CacheEntryRecord r;
  r.key           = res[0][0].c_str();
  r.payload       = res[0][1].c_str();
  r.created_at_ms = res[0][2].as<std::int64_t>();
  r.expires_at_ms = res[0][3].as<std::int64_t>();
  r.generation    = res[0][4].c_str();
  return r;
}

Result PgRepository::DeleteCacheEntry(Transaction& t, const std::string& key) {
  try {
    auto res = TX(t).Work().exec_params("DELETE FROM cache_entries WHERE key=$1;", key);
    return res.affected_rows() > 0 ? Result::Ok() : Result::Err(ErrorCode::NotFound);
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::DeleteCacheEntriesExpiredBefore(Transaction& t, std::int64_t cutoff_ms, std::uint64_t& removed) {
  removed = 0;
  try {
    auto res = TX(t).Work().exec_params("DELETE FROM cache_entries WHERE expires_at_ms<=$1;", cutoff_ms);
    removed  = static_cast<std::uint64_t>(res.affected_rows());
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

} // namespace roadcast::db::postgres
