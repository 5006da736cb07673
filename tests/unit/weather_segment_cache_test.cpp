#include "internal/core/weather_segment_cache.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <thread>
#include <vector>

#include "internal/cache/durable_cache_layer.hpp"
#include "internal/cache/memory_cache_layer.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/util/errors.hpp"
#include "tests/support/fakes.hpp"

namespace {

using namespace std::chrono_literals;
using roadcast::core::WeatherQuery;
using roadcast::core::WeatherSegmentCache;
using roadcast::testing::FakeWeatherProvider;

const roadcast::spatial::Coordinate kTehran{35.6892, 51.3890};
const roadcast::spatial::Coordinate kMashhad{36.2605, 59.6168};

struct Fixture {
  std::shared_ptr<FakeWeatherProvider>              provider = std::make_shared<FakeWeatherProvider>();
  std::shared_ptr<roadcast::spatial::SpatialCellIndex> index = std::make_shared<roadcast::spatial::SpatialCellIndex>(7);
  std::shared_ptr<roadcast::cache::TieredCache>     cache    = std::make_shared<roadcast::cache::TieredCache>(
      std::make_shared<roadcast::cache::MemoryCacheLayer>(1000),
      std::make_shared<roadcast::cache::DurableCacheLayer>(std::make_shared<roadcast::db::memory::MemoryRepository>()), 1h);
  std::shared_ptr<roadcast::cache::DedupGate> gate = std::make_shared<roadcast::cache::DedupGate>();
  WeatherSegmentCache                         weather;

  Fixture() : weather(index, cache, gate, provider, Options(), roadcast::config::GateOptions{}, 1h) {
  }

  static roadcast::config::WeatherOptions Options() {
    roadcast::config::WeatherOptions options;
    options.default_time_zone = "Asia/Tehran";
    options.max_parallel_fetches = 4;
    return options;
  }
};

// Somewhere in the next hour, far enough from its end that the test never
// straddles a roll-over.
roadcast::util::TimePoint SoonForecast() {
  return roadcast::util::Now() + 90min;
}

void TestConcurrentGetsFetchOnce() {
  Fixture f;
  f.provider->SetDelay(100ms);
  const auto forecast = SoonForecast();

  std::vector<std::thread> threads;
  for (int i = 0; i < 50; ++i) {
    threads.emplace_back([&] {
      auto result = f.weather.Get(kTehran, forecast);
      assert(!result.stale);
      assert(result.payload.condition() == "clear");
    });
  }
  for (auto& t : threads) t.join();

  assert(f.provider->Calls() == 1);
  assert(f.weather.Stats().provider_calls == 1);
}

void TestSecondReadIsCached() {
  Fixture    f;
  const auto forecast = SoonForecast();

  auto first  = f.weather.Get(kTehran, forecast);
  auto second = f.weather.Get(kTehran, forecast);
  assert(f.provider->Calls() == 1);
  assert(first.cell == second.cell);
  assert(second.payload.model_run() == "run-1");
  assert(second.payload.has_expires_at());
}

void TestPastHourAlwaysGoesToOrigin() {
  Fixture    f;
  const auto past = roadcast::util::Now() - 3h;

  f.weather.Get(kTehran, past);
  f.weather.Get(kTehran, past);
  assert(f.provider->Calls() == 2);
  assert(f.cache->Stats().fast.writes == 0);
  assert(f.cache->Stats().durable.writes == 0);
}

void TestModelRunAdvancesGeneration() {
  Fixture    f;
  const auto forecast = SoonForecast();

  f.weather.Get(kTehran, forecast);
  assert(f.weather.Generation() == "run-1");

  f.provider->SetModelRun("run-2");
  // Another hour triggers a fetch that reports the new run.
  f.weather.Get(kTehran, forecast + 2h);
  assert(f.weather.Generation() == "run-2");

  // Entries of run-1 are no longer reachable.
  f.weather.Get(kTehran, forecast);
  assert(f.provider->Calls() == 3);
  assert(f.weather.Stats().model_refreshes == 2);
}

void TestProviderFailureWithoutFallback() {
  Fixture f;
  f.provider->SetFailing(true);

  bool threw = false;
  try {
    f.weather.Get(kTehran, SoonForecast());
  } catch (const roadcast::util::ProviderUnavailable&) {
    threw = true;
  }
  assert(threw);
  assert(f.weather.Stats().provider_failures == 1);
}

void TestProviderFailureServesStaleWithinGrace() {
  Fixture    f;
  const auto forecast = SoonForecast();

  // Plant an entry under the key the next read will use, expired 5 minutes ago.
  const auto zone = roadcast::cache::TemporalCacheKey::LoadZone("Asia/Tehran");
  const auto key  = roadcast::cache::TemporalCacheKey::Build(f.index->Encode(kTehran), forecast, f.weather.Generation(), zone);
  const auto now  = roadcast::util::Now();
  f.cache->Put(roadcast::cache::CacheEntry{key, R"({"temperature":11.5,"condition":"rain","modelRun":"0"})", now - 2h, now - 5min, "0"}, 0ms,
               true);

  f.provider->SetFailing(true);
  auto result = f.weather.Get(kTehran, forecast);
  assert(result.stale);
  assert(result.payload.condition() == "rain");
  assert(f.weather.Stats().stale_serves == 1);
}

void TestGetManyGroupsByCellAndHour() {
  Fixture    f;
  const auto forecast = SoonForecast();

  std::vector<WeatherQuery> queries = {
      {kTehran, forecast, ""},
      {kTehran, forecast, ""},
      {kMashhad, forecast, ""},
      {kTehran, forecast, ""},
      {{95.0, 0.0}, forecast, ""},
  };
  auto segments = f.weather.GetMany(queries);

  assert(segments.size() == 5);
  assert(f.provider->Calls() == 2);
  assert(segments[0].cell() == segments[1].cell());
  assert(segments[0].cell() != segments[2].cell());
  assert(segments[3].weather().condition() == "clear");
  assert(segments[4].error_kind() == roadcast::core::v1::ERROR_KIND_INVALID);
}

void TestGetManyReportsProviderFailurePerSegment() {
  Fixture f;
  f.provider->SetFailing(true);

  auto segments = f.weather.GetMany(std::vector<WeatherQuery>{WeatherQuery{kTehran, SoonForecast(), ""}});
  assert(segments.size() == 1);
  assert(segments[0].error_kind() == roadcast::core::v1::ERROR_KIND_PROVIDER_UNAVAILABLE);
  assert(!segments[0].error().empty());
}

} // namespace

int main() {
  TestConcurrentGetsFetchOnce();
  TestSecondReadIsCached();
  TestPastHourAlwaysGoesToOrigin();
  TestModelRunAdvancesGeneration();
  TestProviderFailureWithoutFallback();
  TestProviderFailureServesStaleWithinGrace();
  TestGetManyGroupsByCellAndHour();
  TestGetManyReportsProviderFailurePerSegment();

  std::cout << "weather_segment_cache_test: pass" << std::endl;
  return 0;
}
