#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/cache_entry_record.hpp"
#include "internal/db/model/edge_record.hpp"
#include "internal/db/model/node_record.hpp"
#include "internal/db/model/place_record.hpp"
#include "internal/db/model/route_row.hpp"

namespace roadcast::db {

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All operations take a Transaction
  - Insert/Upsert calls that collide on a natural key succeed and report the
    id of the surviving row (ON CONFLICT DO NOTHING semantics), so writers
    need no application-level lock
  - Edge rows violating distance/speed/duration > 0 are rejected with
    ConstraintViolation and never stored

  The DB is the source of truth for:
    places, road graph, computed routes, durable cache entries
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Places
  // ---------------------------------------------------------------------

  // Sets record.id to the surviving row; an existing row is left untouched.
  virtual Result UpsertPlace(Transaction&, model::PlaceRecord& record) = 0;

  virtual std::optional<model::PlaceRecord> GetPlace(Transaction&, std::int64_t id) = 0;

  virtual std::optional<model::PlaceRecord> FindPlace(Transaction&, const std::string& name, const std::string& place_type,
                                                      const std::string& region) = 0;

  virtual std::vector<model::PlaceRecord> ListPlaces(Transaction&) = 0;

  // ---------------------------------------------------------------------
  // Road graph
  // ---------------------------------------------------------------------

  // Sets record.id; collides on coord_key.
  virtual Result InsertNode(Transaction&, model::NodeRecord& record) = 0;

  // Marks the node as an access point of the place. A node belongs to at
  // most one place: relinking to the same place is Ok, a node already
  // linked elsewhere gives ConstraintViolation and is left unchanged.
  virtual Result LinkNodeToPlace(Transaction&, std::int64_t node_id, std::int64_t place_id) = 0;

  virtual std::optional<model::NodeRecord> GetNode(Transaction&, std::int64_t id) = 0;

  virtual std::vector<model::NodeRecord> ListNodes(Transaction&) = 0;

  // Sets record.id; collides on (source_node, target_node).
  virtual Result UpsertEdge(Transaction&, model::EdgeRecord& record) = 0;

  virtual std::optional<model::EdgeRecord> GetEdge(Transaction&, std::int64_t source_node, std::int64_t target_node) = 0;

  virtual std::vector<model::EdgeRecord> ListEdges(Transaction&) = 0;

  virtual model::GraphCounts CountGraph(Transaction&) = 0;

  // ---------------------------------------------------------------------
  // Routes
  // ---------------------------------------------------------------------

  virtual Result UpsertRoute(Transaction&, const model::RouteRow& row) = 0;

  virtual std::optional<model::RouteRow> GetRoute(Transaction&, std::int64_t source_place_id, std::int64_t target_place_id) = 0;

  virtual Result DeleteRoute(Transaction&, std::int64_t source_place_id, std::int64_t target_place_id) = 0;

  // ---------------------------------------------------------------------
  // Durable cache entries
  // ---------------------------------------------------------------------

  virtual Result UpsertCacheEntry(Transaction&, const model::CacheEntryRecord& record) = 0;

  virtual std::optional<model::CacheEntryRecord> GetCacheEntry(Transaction&, const std::string& key) = 0;

  virtual Result DeleteCacheEntry(Transaction&, const std::string& key) = 0;

  virtual Result DeleteCacheEntriesExpiredBefore(Transaction&, std::int64_t cutoff_ms, std::uint64_t& removed) = 0;
};

} // namespace roadcast::db
