#include "internal/cache/cache_janitor.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <thread>

#include "internal/cache/durable_cache_layer.hpp"
#include "internal/cache/memory_cache_layer.hpp"
#include "internal/db/memory/memory_repository.hpp"

namespace {

using namespace std::chrono_literals;
using roadcast::cache::CacheEntry;
using roadcast::cache::CacheJanitor;
using roadcast::cache::DurableCacheLayer;
using roadcast::cache::MemoryCacheLayer;
using roadcast::cache::TieredCache;

std::shared_ptr<TieredCache> MakeCache() {
  return std::make_shared<TieredCache>(std::make_shared<MemoryCacheLayer>(100),
                                       std::make_shared<DurableCacheLayer>(std::make_shared<roadcast::db::memory::MemoryRepository>()), 1h);
}

// Entry that expired `ago` before now.
void PutExpired(TieredCache& cache, const std::string& key, std::chrono::milliseconds ago) {
  const auto now = roadcast::util::Now();
  cache.Put(CacheEntry{key, "{}", now - ago - 1h, now - ago, "g"}, 0ms, true);
}

void TestRunOnceHonoursGrace() {
  auto cache = MakeCache();
  const auto now = roadcast::util::Now();
  cache->Put(CacheEntry{"fresh", "{}", now, now + 1h, "g"}, 1h, true);
  PutExpired(*cache, "recent", 10min);
  PutExpired(*cache, "ancient", 3h);

  CacheJanitor janitor(cache, 1h, 1h);
  assert(janitor.RunOnce() >= 1);

  assert(cache->Get("fresh").has_value());
  // Still inside the stale window, so the fallback can use it.
  assert(cache->GetStale("recent", 1h).has_value());
  assert(!cache->GetStale("ancient", 24h).has_value());

  assert(janitor.RunOnce() == 0);
}

void TestZeroGracePurgesEverythingExpired() {
  auto cache = MakeCache();
  PutExpired(*cache, "recent", 10min);

  CacheJanitor janitor(cache, 1h, 0ms);
  assert(janitor.RunOnce() >= 1);
  assert(!cache->GetStale("recent", 24h).has_value());
}

void TestBackgroundLoopPurges() {
  auto cache = MakeCache();
  PutExpired(*cache, "ancient", 3h);

  CacheJanitor janitor(cache, 10ms, 1h);
  janitor.Start();

  const auto deadline = std::chrono::steady_clock::now() + 5s;
  while (cache->GetStale("ancient", 24h).has_value() && std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(5ms);
  }
  janitor.Stop();
  assert(!cache->GetStale("ancient", 24h).has_value());

  // Stop is idempotent.
  janitor.Stop();
}

} // namespace

int main() {
  TestRunOnceHonoursGrace();
  TestZeroGracePurgesEverythingExpired();
  TestBackgroundLoopPurges();

  std::cout << "cache_janitor_test: pass" << std::endl;
  return 0;
}
