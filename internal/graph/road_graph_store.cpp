#include "road_graph_store.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <mutex>

#include "internal/db/api/db_error.hpp"
#include "internal/observability/logging.hpp"
#include "internal/spatial/wkt.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace roadcast::graph {

using roadcast::observability::IntField;

std::string CoordKey(const spatial::Coordinate& c) {
  char buf[64];
  std::snprintf(buf, sizeof(buf), "%.6f:%.6f", c.lat, c.lon);
  return buf;
}

namespace {

void AddAccess(GraphArena& arena, PlaceId place, NodeId node) {
  auto& list = arena.access_nodes[place];
  if (std::find(list.begin(), list.end(), node) == list.end()) list.push_back(node);
}

} // namespace

RoadGraphStore::RoadGraphStore(std::shared_ptr<db::Repository> repo, std::shared_ptr<NearestNodeLocator> locator, config::GraphOptions options)
    : repo_(std::move(repo)), locator_(std::move(locator)), options_(options) {
}

void RoadGraphStore::Reload() {
  auto tx    = repo_->Begin();
  auto nodes = repo_->ListNodes(*tx);
  auto edges = repo_->ListEdges(*tx);
  tx->Commit();

  GraphArena                                       fresh;
  std::vector<std::pair<NodeId, spatial::Coordinate>> points;
  fresh.nodes.reserve(nodes.size());
  fresh.out_edges.resize(nodes.size());
  points.reserve(nodes.size());

  for (const auto& n : nodes) {
    fresh.node_slot[n.id] = fresh.nodes.size();
    fresh.nodes.push_back(GraphNode{n.id, {n.lat, n.lon}, n.linked_place_id});
    if (n.linked_place_id) AddAccess(fresh, *n.linked_place_id, n.id);
    points.emplace_back(n.id, spatial::Coordinate{n.lat, n.lon});
  }

  for (const auto& e : edges) {
    auto src = fresh.node_slot.find(e.source_node);
    if (src == fresh.node_slot.end() || !fresh.node_slot.count(e.target_node)) continue;

    fresh.edge_slot[e.id] = fresh.edges.size();
    fresh.out_edges[src->second].push_back(fresh.edges.size());
    fresh.edges.push_back(GraphEdge{e.id, e.source_node, e.target_node, e.distance_m, e.duration_s});
  }

  {
    std::unique_lock lock(mutex_);
    arena_ = std::move(fresh);
    locator_->Rebuild(points);
  }

  ROADCAST_LOG_INFO("road graph loaded", {IntField("nodes", static_cast<std::int64_t>(nodes.size())),
                                          IntField("edges", static_cast<std::int64_t>(edges.size()))});
}

// ------------------------------------------------------------------
// Places
// ------------------------------------------------------------------

db::model::PlaceRecord RoadGraphStore::UpsertPlace(const PlaceInput& place) {
  if (place.name.empty() || place.place_type.empty()) {
    throw util::Invalid("place needs a name and a type");
  }
  if (!spatial::IsValid(place.coord)) {
    throw util::Invalid("place coordinate out of range: " + place.name);
  }

  db::model::PlaceRecord record;
  record.name          = place.name;
  record.place_type    = place.place_type;
  record.region        = place.region;
  record.lat           = place.coord.lat;
  record.lon           = place.coord.lon;
  record.time_zone     = place.time_zone;
  record.created_at_ms = util::ToUnixMillis(util::Now());

  auto tx = repo_->Begin();
  db::ThrowIfDbError(repo_->UpsertPlace(*tx, record), "upsert place " + place.name);
  auto stored = repo_->GetPlace(*tx, record.id);
  tx->Commit();

  if (!stored) throw util::NotFound("place vanished after upsert: " + place.name);
  if (stored->created_at_ms == record.created_at_ms) {
    ROADCAST_LOG_DEBUG("place stored", {observability::StringField("place", place.name), observability::CoordField("at", place.coord.lat, place.coord.lon)});
  }
  return *stored;
}

std::optional<db::model::PlaceRecord> RoadGraphStore::GetPlace(PlaceId id) {
  auto tx     = repo_->Begin();
  auto record = repo_->GetPlace(*tx, id);
  tx->Commit();
  return record;
}

std::optional<db::model::PlaceRecord> RoadGraphStore::FindPlace(const std::string& name, const std::string& place_type,
                                                                const std::string& region) {
  auto tx     = repo_->Begin();
  auto record = repo_->FindPlace(*tx, name, place_type, region);
  tx->Commit();
  return record;
}

// ------------------------------------------------------------------
// Nodes
// ------------------------------------------------------------------

NodeId RoadGraphStore::UpsertNode(const spatial::Coordinate& coord, std::optional<PlaceId> place_id, const std::string& label) {
  if (!spatial::IsValid(coord)) {
    throw util::Invalid("node coordinate out of range");
  }

  if (auto existing = locator_->Nearest(coord, options_.snap_tolerance_m)) {
    if (place_id) LinkAccessPoint(*existing, *place_id);
    return *existing;
  }

  db::model::NodeRecord record;
  record.lat             = coord.lat;
  record.lon             = coord.lon;
  record.coord_key       = CoordKey(coord);
  record.linked_place_id = place_id;
  record.node_type       = place_id ? db::model::kNodeTypeAccessPoint : db::model::kNodeTypeRoad;
  record.label           = label;

  auto tx = repo_->Begin();
  db::ThrowIfDbError(repo_->InsertNode(*tx, record), "insert node");
  // A concurrent writer may have created the row without our link.
  if (place_id) LinkOrReport(*tx, record.id, *place_id);
  auto stored = repo_->GetNode(*tx, record.id);
  tx->Commit();

  if (!stored) throw util::NotFound("node vanished after insert");
  AdoptNode(*stored);
  return stored->id;
}

bool RoadGraphStore::LinkOrReport(db::Transaction& tx, NodeId node, PlaceId place) {
  auto result = repo_->LinkNodeToPlace(tx, node, place);
  if (result.code == db::ErrorCode::ConstraintViolation) {
    // The place keeps resolving through the nearest-node fallback.
    ROADCAST_LOG_WARN("access point belongs to another place",
                      {IntField("node", node), IntField("place", place), observability::StringField("detail", result.message)});
    return false;
  }
  db::ThrowIfDbError(result, "link node");
  return true;
}

void RoadGraphStore::LinkAccessPoint(NodeId node, PlaceId place) {
  auto tx = repo_->Begin();
  if (!LinkOrReport(*tx, node, place)) {
    tx->Commit();
    return;
  }
  auto stored = repo_->GetNode(*tx, node);
  tx->Commit();

  if (stored) AdoptNode(*stored);
}

void RoadGraphStore::AdoptNode(const db::model::NodeRecord& record) {
  bool inserted = false;
  {
    std::unique_lock lock(mutex_);

    auto it = arena_.node_slot.find(record.id);
    if (it == arena_.node_slot.end()) {
      arena_.node_slot[record.id] = arena_.nodes.size();
      arena_.nodes.push_back(GraphNode{record.id, {record.lat, record.lon}, record.linked_place_id});
      arena_.out_edges.emplace_back();
      inserted = true;
    } else {
      arena_.nodes[it->second].place_id = record.linked_place_id;
    }

    if (record.linked_place_id) AddAccess(arena_, *record.linked_place_id, record.id);
  }

  if (inserted) locator_->Insert(record.id, {record.lat, record.lon});
}

std::optional<GraphNode> RoadGraphStore::Node(NodeId id) const {
  std::shared_lock lock(mutex_);
  const auto*      node = arena_.FindNode(id);
  if (!node) return std::nullopt;
  return *node;
}

std::vector<NodeId> RoadGraphStore::AccessNodes(PlaceId place) const {
  std::shared_lock lock(mutex_);
  auto             it = arena_.access_nodes.find(place);
  if (it == arena_.access_nodes.end()) return {};
  return it->second;
}

// ------------------------------------------------------------------
// Edges
// ------------------------------------------------------------------

EdgeId RoadGraphStore::UpsertEdge(const EdgeInput& edge) {
  if (!std::isfinite(edge.distance_m) || edge.distance_m <= 0.0) {
    throw util::Invalid("edge distance must be positive");
  }
  if (!std::isfinite(edge.speed_kmh) || edge.speed_kmh <= 0.0) {
    throw util::Invalid("edge speed must be positive");
  }
  if (edge.source == edge.target) {
    throw util::Invalid("edge endpoints must differ");
  }
  if (!Node(edge.source) || !Node(edge.target)) {
    throw util::NotFound("edge endpoint not in graph");
  }

  db::model::EdgeRecord record;
  record.source_node   = edge.source;
  record.target_node   = edge.target;
  record.distance_m    = edge.distance_m;
  record.max_speed_kmh = edge.speed_kmh;
  record.duration_s    = DurationSeconds(edge.distance_m, edge.speed_kmh);
  record.geometry_wkt  = spatial::ToWkt(edge.geometry);
  record.road_type     = edge.road_type;
  record.road_name     = edge.road_name;

  auto tx = repo_->Begin();
  db::ThrowIfDbError(repo_->UpsertEdge(*tx, record), "upsert edge");
  auto stored = repo_->GetEdge(*tx, edge.source, edge.target);
  tx->Commit();

  if (!stored) throw util::NotFound("edge vanished after upsert");
  AdoptEdge(*stored);
  return stored->id;
}

void RoadGraphStore::AdoptEdge(const db::model::EdgeRecord& record) {
  std::unique_lock lock(mutex_);
  if (arena_.edge_slot.count(record.id)) return;

  auto src = arena_.node_slot.find(record.source_node);
  if (src == arena_.node_slot.end()) return;

  arena_.edge_slot[record.id] = arena_.edges.size();
  arena_.out_edges[src->second].push_back(arena_.edges.size());
  arena_.edges.push_back(GraphEdge{record.id, record.source_node, record.target_node, record.distance_m, record.duration_s});
}

db::model::GraphCounts RoadGraphStore::Counts() {
  auto tx     = repo_->Begin();
  auto counts = repo_->CountGraph(*tx);
  tx->Commit();
  return counts;
}

} // namespace roadcast::graph
