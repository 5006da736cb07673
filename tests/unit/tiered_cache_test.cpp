#include "internal/cache/tiered_cache.hpp"

#include <google/protobuf/util/json_util.h>

#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>

#include "internal/cache/durable_cache_layer.hpp"
#include "internal/cache/memory_cache_layer.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/util/errors.hpp"
#include "roadcast/core/v1/types.pb.h"
#include "tests/support/fakes.hpp"

namespace {

using namespace std::chrono_literals;
using roadcast::cache::CacheEntry;
using roadcast::cache::DurableCacheLayer;
using roadcast::cache::MemoryCacheLayer;
using roadcast::cache::TieredCache;
using roadcast::testing::SwitchableCacheLayer;

struct Fixture {
  std::shared_ptr<MemoryCacheLayer>     fast_store    = std::make_shared<MemoryCacheLayer>(100);
  std::shared_ptr<SwitchableCacheLayer> fast          = std::make_shared<SwitchableCacheLayer>(fast_store);
  std::shared_ptr<SwitchableCacheLayer> durable       = std::make_shared<SwitchableCacheLayer>(
      std::make_shared<DurableCacheLayer>(std::make_shared<roadcast::db::memory::MemoryRepository>()));
  TieredCache                           cache{fast, durable, 1h};
};

std::string RouteJson() {
  roadcast::core::v1::RouteRecord record;
  record.set_source_place_id(1);
  record.set_target_place_id(2);
  record.add_nodes(10);
  record.add_nodes(11);
  record.add_nodes(12);
  record.set_distance_km(905.4);
  record.set_duration_hours(10.5);

  std::string json;
  assert(google::protobuf::util::MessageToJsonString(record, &json).ok());
  return json;
}

CacheEntry Entry(const std::string& key, const std::string& payload, std::chrono::milliseconds lifetime) {
  const auto now = roadcast::util::Now();
  return CacheEntry{key, payload, now, now + lifetime, "g"};
}

void TestNoExpiryFitsTheClock() {
  const auto never = roadcast::cache::NoExpiry();
  assert(never > roadcast::util::Now() + 24h * 365 * 100);
  assert(roadcast::util::ToUnixMillis(never) == roadcast::cache::kNoExpiryUnixMillis);

  DurableCacheLayer durable(std::make_shared<roadcast::db::memory::MemoryRepository>());
  durable.Put(CacheEntry{"route:7:8", "{}", roadcast::util::Now(), never, ""}, std::nullopt);

  auto stored = durable.Get("route:7:8");
  assert(stored.has_value());
  assert(stored->expires_at == never);
  assert(!stored->IsExpired(roadcast::util::Now()));
}

void TestDurableRecoversAfterFastEviction() {
  Fixture    f;
  const auto json = RouteJson();
  f.cache.Put(CacheEntry{"route:1:2", json, roadcast::util::Now(), roadcast::cache::NoExpiry(), ""}, 1h, true);

  assert(f.fast_store->Remove("route:1:2"));

  auto hit = f.cache.Get("route:1:2");
  assert(hit.has_value());
  assert(hit->payload == json);

  roadcast::core::v1::RouteRecord decoded;
  assert(google::protobuf::util::JsonStringToMessage(hit->payload, &decoded).ok());
  assert(decoded.nodes_size() == 3);
  assert(decoded.duration_hours() == 10.5);

  // Re-warmed: the fast tier answers on its own now.
  assert(f.cache.Stats().backfills == 1);
  assert(f.fast_store->Get("route:1:2").has_value());
}

void TestFastLayerDownFallsThrough() {
  Fixture f;
  f.fast->SetDown(true);

  f.cache.Put(Entry("k", "v", 1h), 1h, true);
  auto hit = f.cache.Get("k");
  assert(hit.has_value());
  assert(hit->payload == "v");

  const auto stats = f.cache.Stats();
  assert(stats.fast.errors >= 2);
  assert(stats.durable.hits == 1);
  // No backfill into a layer that just failed.
  assert(stats.backfills == 0);
}

void TestBothLayersDownReportsAbsent() {
  Fixture f;
  f.fast->SetDown(true);
  f.durable->SetDown(true);

  f.cache.Put(Entry("k", "v", 1h), 1h, true);
  assert(!f.cache.Get("k").has_value());
  assert(f.cache.Stats().degraded_reads == 1);
}

void TestRejectsEntryExpiringBeforeCreation() {
  Fixture    f;
  const auto now = roadcast::util::Now();

  bool threw = false;
  try {
    f.cache.Put(CacheEntry{"k", "v", now, now, ""}, 1h, true);
  } catch (const roadcast::util::Invalid&) {
    threw = true;
  }
  assert(threw);
  assert(!f.cache.Get("k").has_value());
}

void TestExpiredEntryOnlyAvailableAsStale() {
  Fixture    f;
  const auto now = roadcast::util::Now();
  f.cache.Put(CacheEntry{"k", "v", now - 2h, now - 10min, ""}, 0ms, true);

  assert(!f.cache.Get("k").has_value());
  assert(f.cache.GetStale("k", 1h).has_value());
  assert(!f.cache.GetStale("k", 5min).has_value());
}

void TestInvalidateAndPurge() {
  Fixture    f;
  const auto now = roadcast::util::Now();
  f.cache.Put(Entry("keep", "v", 1h), 1h, true);
  f.cache.Put(CacheEntry{"old", "v", now - 3h, now - 2h, ""}, 0ms, true);

  assert(f.cache.PurgeExpired(now - 1h) == 1);
  assert(!f.cache.GetStale("old", 24h).has_value());

  assert(f.cache.Invalidate("keep"));
  assert(!f.cache.Get("keep").has_value());
  assert(!f.cache.Invalidate("keep"));
}

} // namespace

int main() {
  TestNoExpiryFitsTheClock();
  TestDurableRecoversAfterFastEviction();
  TestFastLayerDownFallsThrough();
  TestBothLayersDownReportsAbsent();
  TestRejectsEntryExpiringBeforeCreation();
  TestExpiredEntryOnlyAvailableAsStale();
  TestInvalidateAndPurge();

  std::cout << "tiered_cache_test: pass" << std::endl;
  return 0;
}
