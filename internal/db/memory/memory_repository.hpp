#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <unordered_map>
#include <utility>

#include "internal/db/api/repository.hpp"

namespace roadcast::db::memory {

class MemoryTransaction;

/*
  In-process repository used for tests and single-node deployments.

  Writes are applied under the repository mutex as they are issued and
  recorded in the transaction's undo log; rollback replays the log.
  Uncommitted writes are therefore visible to other transactions.
*/
class MemoryRepository final : public db::Repository {
public:
  MemoryRepository();

  std::unique_ptr<Transaction> Begin() override;

  Result UpsertPlace(Transaction&, model::PlaceRecord&) override;
  std::optional<model::PlaceRecord> GetPlace(Transaction&, std::int64_t) override;
  std::optional<model::PlaceRecord> FindPlace(Transaction&, const std::string&, const std::string&, const std::string&) override;
  std::vector<model::PlaceRecord> ListPlaces(Transaction&) override;

  Result InsertNode(Transaction&, model::NodeRecord&) override;
  Result LinkNodeToPlace(Transaction&, std::int64_t node_id, std::int64_t place_id) override;
  std::optional<model::NodeRecord> GetNode(Transaction&, std::int64_t) override;
  std::vector<model::NodeRecord> ListNodes(Transaction&) override;

  Result UpsertEdge(Transaction&, model::EdgeRecord&) override;
  std::optional<model::EdgeRecord> GetEdge(Transaction&, std::int64_t, std::int64_t) override;
  std::vector<model::EdgeRecord> ListEdges(Transaction&) override;
  model::GraphCounts CountGraph(Transaction&) override;

  Result UpsertRoute(Transaction&, const model::RouteRow&) override;
  std::optional<model::RouteRow> GetRoute(Transaction&, std::int64_t, std::int64_t) override;
  Result DeleteRoute(Transaction&, std::int64_t, std::int64_t) override;

  Result UpsertCacheEntry(Transaction&, const model::CacheEntryRecord&) override;
  std::optional<model::CacheEntryRecord> GetCacheEntry(Transaction&, const std::string&) override;
  Result DeleteCacheEntry(Transaction&, const std::string&) override;
  Result DeleteCacheEntriesExpiredBefore(Transaction&, std::int64_t cutoff_ms, std::uint64_t& removed) override;

private:
  friend class MemoryTransaction;

  using PlacePair = std::pair<std::int64_t, std::int64_t>;

  struct State {
    std::map<std::int64_t, model::PlaceRecord> places;
    std::map<std::string, std::int64_t>        place_by_identity;

    std::map<std::int64_t, model::NodeRecord>            nodes;
    std::unordered_map<std::string, std::int64_t>        node_by_coord;
    std::map<std::int64_t, model::EdgeRecord>            edges;
    std::map<std::pair<std::int64_t, std::int64_t>, std::int64_t> edge_by_pair;

    std::map<PlacePair, model::RouteRow>                      routes;
    std::unordered_map<std::string, model::CacheEntryRecord> cache_entries;

    std::int64_t next_place_id = 1;
    std::int64_t next_node_id  = 1;
    std::int64_t next_edge_id  = 1;
    std::int64_t next_route_id = 1;
  };

  std::mutex mutex_;
  State state_;
};

}
