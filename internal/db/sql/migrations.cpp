#include "migrations.hpp"

namespace roadcast::db::sql {

void RunMigrations(MigrationExecutor& executor, const std::vector<std::string>& ordered_sql) {
  for (const auto& sql : ordered_sql) {
    executor.ExecuteSQL(sql);
  }
}

const std::vector<std::string>& SqliteSchema() {
  static const std::vector<std::string> kSchema = {
      "CREATE TABLE IF NOT EXISTS places (place_id INTEGER PRIMARY KEY AUTOINCREMENT, name TEXT NOT NULL, place_type TEXT NOT NULL, "
      "region TEXT NOT NULL DEFAULT '', lat REAL NOT NULL, lon REAL NOT NULL, time_zone TEXT NOT NULL DEFAULT '', metadata TEXT NOT NULL "
      "DEFAULT '{}', created_at_ms INTEGER NOT NULL, UNIQUE(name, place_type, region));",
      "CREATE TABLE IF NOT EXISTS nodes (node_id INTEGER PRIMARY KEY AUTOINCREMENT, lat REAL NOT NULL, lon REAL NOT NULL, coord_key TEXT NOT NULL "
      "UNIQUE, linked_place_id INTEGER REFERENCES places(place_id) ON DELETE SET NULL, node_type TEXT NOT NULL DEFAULT 'road', label TEXT NOT "
      "NULL DEFAULT '');",
      "CREATE INDEX IF NOT EXISTS idx_nodes_linked_place ON nodes(linked_place_id);",
      "CREATE TABLE IF NOT EXISTS edges (edge_id INTEGER PRIMARY KEY AUTOINCREMENT, source_node INTEGER NOT NULL REFERENCES nodes(node_id) ON "
      "DELETE CASCADE, target_node INTEGER NOT NULL REFERENCES nodes(node_id) ON DELETE CASCADE, distance_m REAL NOT NULL CHECK (distance_m > 0), "
      "max_speed_kmh REAL NOT NULL CHECK (max_speed_kmh > 0), duration_s REAL NOT NULL CHECK (duration_s > 0), geometry TEXT NOT NULL DEFAULT '', "
      "road_type TEXT NOT NULL DEFAULT '', road_name TEXT NOT NULL DEFAULT '', UNIQUE(source_node, target_node));",
      "CREATE TABLE IF NOT EXISTS routes (route_id INTEGER PRIMARY KEY AUTOINCREMENT, source_place_id INTEGER NOT NULL REFERENCES places(place_id) "
      "ON DELETE CASCADE, target_place_id INTEGER NOT NULL REFERENCES places(place_id) ON DELETE CASCADE, payload TEXT NOT NULL, distance_km REAL "
      "NOT NULL, duration_hours REAL NOT NULL, created_at_ms INTEGER NOT NULL, UNIQUE(source_place_id, target_place_id));",
      "CREATE TABLE IF NOT EXISTS cache_entries (key TEXT PRIMARY KEY, payload TEXT NOT NULL, created_at_ms INTEGER NOT NULL, expires_at_ms "
      "INTEGER NOT NULL, generation TEXT NOT NULL DEFAULT '', CHECK (expires_at_ms > created_at_ms));",
      "CREATE INDEX IF NOT EXISTS idx_cache_entries_expires ON cache_entries(expires_at_ms);",
  };
  return kSchema;
}

const std::vector<std::string>& PostgresSchema() {
  static const std::vector<std::string> kSchema = {
      "CREATE TABLE IF NOT EXISTS places (place_id BIGSERIAL PRIMARY KEY, name TEXT NOT NULL, place_type TEXT NOT NULL, region TEXT NOT NULL "
      "DEFAULT '', lat DOUBLE PRECISION NOT NULL, lon DOUBLE PRECISION NOT NULL, time_zone TEXT NOT NULL DEFAULT '', metadata JSONB NOT NULL "
      "DEFAULT '{}', created_at_ms BIGINT NOT NULL, UNIQUE(name, place_type, region));",
      "CREATE TABLE IF NOT EXISTS nodes (node_id BIGSERIAL PRIMARY KEY, lat DOUBLE PRECISION NOT NULL, lon DOUBLE PRECISION NOT NULL, coord_key "
      "TEXT NOT NULL UNIQUE, linked_place_id BIGINT REFERENCES places(place_id) ON DELETE SET NULL, node_type TEXT NOT NULL DEFAULT 'road', label "
      "TEXT NOT NULL DEFAULT '');",
      "CREATE INDEX IF NOT EXISTS idx_nodes_linked_place ON nodes(linked_place_id);",
      "CREATE TABLE IF NOT EXISTS edges (edge_id BIGSERIAL PRIMARY KEY, source_node BIGINT NOT NULL REFERENCES nodes(node_id) ON DELETE CASCADE, "
      "target_node BIGINT NOT NULL REFERENCES nodes(node_id) ON DELETE CASCADE, distance_m DOUBLE PRECISION NOT NULL CHECK (distance_m > 0), "
      "max_speed_kmh DOUBLE PRECISION NOT NULL CHECK (max_speed_kmh > 0), duration_s DOUBLE PRECISION NOT NULL CHECK (duration_s > 0), geometry "
      "TEXT NOT NULL DEFAULT '', road_type TEXT NOT NULL DEFAULT '', road_name TEXT NOT NULL DEFAULT '', UNIQUE(source_node, target_node));",
      "CREATE TABLE IF NOT EXISTS routes (route_id BIGSERIAL PRIMARY KEY, source_place_id BIGINT NOT NULL REFERENCES places(place_id) ON DELETE "
      "CASCADE, target_place_id BIGINT NOT NULL REFERENCES places(place_id) ON DELETE CASCADE, payload JSONB NOT NULL, distance_km DOUBLE "
      "PRECISION NOT NULL, duration_hours DOUBLE PRECISION NOT NULL, created_at_ms BIGINT NOT NULL, UNIQUE(source_place_id, target_place_id));",
      "CREATE TABLE IF NOT EXISTS cache_entries (key TEXT PRIMARY KEY, payload TEXT NOT NULL, created_at_ms BIGINT NOT NULL, expires_at_ms BIGINT "
      "NOT NULL, generation TEXT NOT NULL DEFAULT '', CHECK (expires_at_ms > created_at_ms));",
      "CREATE INDEX IF NOT EXISTS idx_cache_entries_expires ON cache_entries(expires_at_ms);",
  };
  return kSchema;
}

} // namespace roadcast::db::sql
