#pragma once

#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <utility>
#include <vector>

#include "internal/config/engine_options.hpp"
#include "internal/db/api/repository.hpp"
#include "nearest_node_locator.hpp"
#include "road_graph.hpp"

namespace roadcast::graph {

struct PlaceInput {
  std::string         name;
  std::string         place_type;
  std::string         region;
  spatial::Coordinate coord;
  std::string         time_zone;
};

struct EdgeInput {
  NodeId                           source = 0;
  NodeId                           target = 0;
  std::vector<spatial::Coordinate> geometry;
  double                           distance_m = 0.0;
  double                           speed_kmh  = 0.0;
  std::string                      road_type;
  std::string                      road_name;
};

/*
  RoadGraphStore

  Durable Place/Node/Edge graph. The repository is the source of truth;
  the arena and the locator are projections kept in step on every write
  and rebuilt wholesale by Reload().

  Writers need no application lock: the store collapses identical inserts
  on its unique keys and reports the surviving row, which the arena then
  adopts idempotently.
*/
class RoadGraphStore {
 public:
  RoadGraphStore(std::shared_ptr<db::Repository> repo, std::shared_ptr<NearestNodeLocator> locator, config::GraphOptions options);

  // Reads every node and edge into a fresh arena and locator.
  void Reload();

  db::model::PlaceRecord                UpsertPlace(const PlaceInput& place);
  std::optional<db::model::PlaceRecord> GetPlace(PlaceId id);
  std::optional<db::model::PlaceRecord> FindPlace(const std::string& name, const std::string& place_type, const std::string& region);

  // Reuses a node within snap tolerance, else creates one. A given place id
  // links the node as that place's access point.
  NodeId UpsertNode(const spatial::Coordinate& coord, std::optional<PlaceId> place_id = std::nullopt, const std::string& label = {});

  void LinkAccessPoint(NodeId node, PlaceId place);
  // False when the node is already another place's access point.
  bool LinkOrReport(db::Transaction& tx, NodeId node, PlaceId place);

  // Throws util::Invalid for non-positive distance or speed or a self loop,
  // util::NotFound for an unknown endpoint.
  EdgeId UpsertEdge(const EdgeInput& edge);

  std::optional<GraphNode> Node(NodeId id) const;
  std::vector<NodeId>      AccessNodes(PlaceId place) const;

  db::model::GraphCounts Counts();

  // Runs f(const GraphArena&) under the shared lock.
  template <typename F>
  auto Read(F&& f) const -> decltype(f(std::declval<const GraphArena&>())) {
    std::shared_lock lock(mutex_);
    return f(arena_);
  }

  const NearestNodeLocator& Locator() const {
    return *locator_;
  }

  const config::GraphOptions& Options() const {
    return options_;
  }

 private:
  void AdoptNode(const db::model::NodeRecord& record);
  void AdoptEdge(const db::model::EdgeRecord& record);

  std::shared_ptr<db::Repository>     repo_;
  std::shared_ptr<NearestNodeLocator> locator_;
  config::GraphOptions                options_;

  mutable std::shared_mutex mutex_;
  GraphArena                arena_;
};

// Six decimals is about 0.1 m; identical provider points collapse on it.
std::string CoordKey(const spatial::Coordinate& c);

} // namespace roadcast::graph
