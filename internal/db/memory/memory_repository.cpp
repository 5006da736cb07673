#include "memory_repository.hpp"

#include "memory_tx.hpp"

namespace roadcast::db::memory {

namespace {

std::string PlaceIdentity(const std::string& name, const std::string& place_type, const std::string& region) {
  return name + '\x1f' + place_type + '\x1f' + region;
}

} // namespace

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

// ------------------------------------------------------------------
// Places
// ------------------------------------------------------------------

Result MemoryRepository::UpsertPlace(Transaction& t, model::PlaceRecord& r) {
  std::scoped_lock lock(mutex_);
  auto&            s        = state_;
  const auto       identity = PlaceIdentity(r.name, r.place_type, r.region);

  if (auto it = s.place_by_identity.find(identity); it != s.place_by_identity.end()) {
    r.id = it->second;
    return Result::Ok();
  }

  r.id = s.next_place_id++;
  s.places[r.id]                = r;
  s.place_by_identity[identity] = r.id;

  const auto id = r.id;
  TX(t).Record([id, identity](State& st) {
    st.places.erase(id);
    st.place_by_identity.erase(identity);
  });
  return Result::Ok();
}

std::optional<model::PlaceRecord> MemoryRepository::GetPlace(Transaction&, std::int64_t id) {
  std::scoped_lock lock(mutex_);
  auto             it = state_.places.find(id);
  if (it == state_.places.end()) return std::nullopt;
  return it->second;
}

std::optional<model::PlaceRecord> MemoryRepository::FindPlace(Transaction&, const std::string& name, const std::string& place_type,
                                                              const std::string& region) {
  std::scoped_lock lock(mutex_);
  auto             it = state_.place_by_identity.find(PlaceIdentity(name, place_type, region));
  if (it == state_.place_by_identity.end()) return std::nullopt;
  return state_.places.at(it->second);
}

std::vector<model::PlaceRecord> MemoryRepository::ListPlaces(Transaction&) {
  std::scoped_lock                lock(mutex_);
  std::vector<model::PlaceRecord> out;
  out.reserve(state_.places.size());
  for (const auto& [_, record] : state_.places) {
    out.push_back(record);
  }
  return out;
}

// ------------------------------------------------------------------
// Nodes
// ------------------------------------------------------------------

Result MemoryRepository::InsertNode(Transaction& t, model::NodeRecord& r) {
  std::scoped_lock lock(mutex_);
  auto&            s = state_;

  if (r.coord_key.empty()) return Result::Err(ErrorCode::ConstraintViolation, "node coord_key is required");
  if (r.linked_place_id && !s.places.contains(*r.linked_place_id)) {
    return Result::Err(ErrorCode::ConstraintViolation, "linked place does not exist");
  }

  if (auto it = s.node_by_coord.find(r.coord_key); it != s.node_by_coord.end()) {
    r.id = it->second;
    return Result::Ok();
  }

  r.id                        = s.next_node_id++;
  s.nodes[r.id]               = r;
  s.node_by_coord[r.coord_key] = r.id;

  const auto id  = r.id;
  const auto key = r.coord_key;
  TX(t).Record([id, key](State& st) {
    st.nodes.erase(id);
    st.node_by_coord.erase(key);
  });
  return Result::Ok();
}

Result MemoryRepository::LinkNodeToPlace(Transaction& t, std::int64_t node_id, std::int64_t place_id) {
  std::scoped_lock lock(mutex_);
  auto&            s  = state_;
  auto             it = s.nodes.find(node_id);
  if (it == s.nodes.end()) return Result::Err(ErrorCode::NotFound, "node not found");
  if (!s.places.contains(place_id)) return Result::Err(ErrorCode::NotFound, "place not found");
  if (it->second.linked_place_id) {
    if (*it->second.linked_place_id == place_id) return Result::Ok();
    return Result::Err(ErrorCode::ConstraintViolation,
                       "node " + std::to_string(node_id) + " already linked to place " + std::to_string(*it->second.linked_place_id));
  }

  const auto previous         = it->second;
  it->second.linked_place_id  = place_id;
  it->second.node_type        = model::kNodeTypeAccessPoint;
  TX(t).Record([previous](State& st) { st.nodes[previous.id] = previous; });
  return Result::Ok();
}

std::optional<model::NodeRecord> MemoryRepository::GetNode(Transaction&, std::int64_t id) {
  std::scoped_lock lock(mutex_);
  auto             it = state_.nodes.find(id);
  if (it == state_.nodes.end()) return std::nullopt;
  return it->second;
}

std::vector<model::NodeRecord> MemoryRepository::ListNodes(Transaction&) {
  std::scoped_lock               lock(mutex_);
  std::vector<model::NodeRecord> out;
  out.reserve(state_.nodes.size());
  for (const auto& [_, record] : state_.nodes) {
    out.push_back(record);
  }
  return out;
}

// ------------------------------------------------------------------
// Edges
// ------------------------------------------------------------------

Result MemoryRepository::UpsertEdge(Transaction& t, model::EdgeRecord& r) {
  if (!(r.distance_m > 0) || !(r.max_speed_kmh > 0) || !(r.duration_s > 0)) {
    return Result::Err(ErrorCode::ConstraintViolation, "edge distance, speed and duration must be positive");
  }

  std::scoped_lock lock(mutex_);
  auto&            s = state_;
  if (!s.nodes.contains(r.source_node) || !s.nodes.contains(r.target_node)) {
    return Result::Err(ErrorCode::ConstraintViolation, "edge endpoints must exist");
  }

  const auto pair = std::make_pair(r.source_node, r.target_node);
  if (auto it = s.edge_by_pair.find(pair); it != s.edge_by_pair.end()) {
    r.id = it->second;
    return Result::Ok();
  }

  r.id               = s.next_edge_id++;
  s.edges[r.id]      = r;
  s.edge_by_pair[pair] = r.id;

  const auto id = r.id;
  TX(t).Record([id, pair](State& st) {
    st.edges.erase(id);
    st.edge_by_pair.erase(pair);
  });
  return Result::Ok();
}

std::optional<model::EdgeRecord> MemoryRepository::GetEdge(Transaction&, std::int64_t source_node, std::int64_t target_node) {
  std::scoped_lock lock(mutex_);
  auto             it = state_.edge_by_pair.find({source_node, target_node});
  if (it == state_.edge_by_pair.end()) return std::nullopt;
  return state_.edges.at(it->second);
}

std::vector<model::EdgeRecord> MemoryRepository::ListEdges(Transaction&) {
  std::scoped_lock               lock(mutex_);
  std::vector<model::EdgeRecord> out;
  out.reserve(state_.edges.size());
  for (const auto& [_, record] : state_.edges) {
    out.push_back(record);
  }
  return out;
}

model::GraphCounts MemoryRepository::CountGraph(Transaction&) {
  std::scoped_lock   lock(mutex_);
  model::GraphCounts counts;
  counts.places = state_.places.size();
  counts.nodes  = state_.nodes.size();
  counts.edges  = state_.edges.size();
  for (const auto& [_, node] : state_.nodes) {
    if (node.node_type == model::kNodeTypeAccessPoint) ++counts.access_points;
  }
  return counts;
}

// ------------------------------------------------------------------
// Routes
// ------------------------------------------------------------------

Result MemoryRepository::UpsertRoute(Transaction& t, const model::RouteRow& r) {
  std::scoped_lock lock(mutex_);
  auto&            s = state_;
  if (!s.places.contains(r.source_place_id) || !s.places.contains(r.target_place_id)) {
    return Result::Err(ErrorCode::ConstraintViolation, "route places must exist");
  }

  const PlacePair                pair{r.source_place_id, r.target_place_id};
  std::optional<model::RouteRow> previous;
  if (auto it = s.routes.find(pair); it != s.routes.end()) previous = it->second;

  model::RouteRow row = r;
  row.id              = previous ? previous->id : s.next_route_id++;
  s.routes[pair]      = row;

  TX(t).Record([pair, previous](State& st) {
    if (previous) {
      st.routes[pair] = *previous;
    } else {
      st.routes.erase(pair);
    }
  });
  return Result::Ok();
}

std::optional<model::RouteRow> MemoryRepository::GetRoute(Transaction&, std::int64_t source_place_id, std::int64_t target_place_id) {
  std::scoped_lock lock(mutex_);
  auto             it = state_.routes.find({source_place_id, target_place_id});
  if (it == state_.routes.end()) return std::nullopt;
  return it->second;
}

Result MemoryRepository::DeleteRoute(Transaction& t, std::int64_t source_place_id, std::int64_t target_place_id) {
  std::scoped_lock lock(mutex_);
  const PlacePair  pair{source_place_id, target_place_id};
  auto             it = state_.routes.find(pair);
  if (it == state_.routes.end()) return Result::Err(ErrorCode::NotFound);

  auto previous = it->second;
  state_.routes.erase(it);
  TX(t).Record([pair, previous](State& st) { st.routes[pair] = previous; });
  return Result::Ok();
}

// ------------------------------------------------------------------
// Cache entries
// ------------------------------------------------------------------

Result MemoryRepository::UpsertCacheEntry(Transaction& t, const model::CacheEntryRecord& r) {
  if (r.expires_at_ms <= r.created_at_ms) {
    return Result::Err(ErrorCode::ConstraintViolation, "cache entry must expire after creation");
  }

  std::scoped_lock                        lock(mutex_);
  std::optional<model::CacheEntryRecord> previous;
  if (auto it = state_.cache_entries.find(r.key); it != state_.cache_entries.end()) previous = it->second;
  state_.cache_entries[r.key] = r;

  const auto key = r.key;
  TX(t).Record([key, previous](State& st) {
    if (previous) {
      st.cache_entries[key] = *previous;
    } else {
      st.cache_entries.erase(key);
    }
  });
  return Result::Ok();
}

std::optional<model::CacheEntryRecord> MemoryRepository::GetCacheEntry(Transaction&, const std::string& key) {
  std::scoped_lock lock(mutex_);
  auto             it = state_.cache_entries.find(key);
  if (it == state_.cache_entries.end()) return std::nullopt;
  return it->second;
}

Result MemoryRepository::DeleteCacheEntry(Transaction& t, const std::string& key) {
  std::scoped_lock lock(mutex_);
  auto             it = state_.cache_entries.find(key);
  if (it == state_.cache_entries.end()) return Result::Err(ErrorCode::NotFound);

  auto previous = it->second;
  state_.cache_entries.erase(it);
  TX(t).Record([previous](State& st) { st.cache_entries[previous.key] = previous; });
  return Result::Ok();
}

Result MemoryRepository::DeleteCacheEntriesExpiredBefore(Transaction& t, std::int64_t cutoff_ms, std::uint64_t& removed) {
  std::scoped_lock lock(mutex_);
  removed = 0;
  for (auto it = state_.cache_entries.begin(); it != state_.cache_entries.end();) {
    if (it->second.expires_at_ms > cutoff_ms) {
      ++it;
      continue;
    }
    auto previous = it->second;
    TX(t).Record([previous](State& st) { st.cache_entries[previous.key] = previous; });
    it = state_.cache_entries.erase(it);
    ++removed;
  }
  return Result::Ok();
}

} // namespace roadcast::db::memory
