#pragma once

#include <exception>
#include <memory>

#include "internal/db/api/repository.hpp"
#include "pg_pool.hpp"
#include "pg_tx.hpp"

namespace roadcast::db::postgres {

class PgRepository final : public db::Repository {
public:
  explicit PgRepository(std::shared_ptr<PgPool> pool);

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
  static PgTransaction& TX(Transaction& t);
  static Result Translate(const std::exception&);

  std::shared_ptr<PgPool> pool_;
};

}
