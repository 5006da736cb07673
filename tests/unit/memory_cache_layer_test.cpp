#include "internal/cache/memory_cache_layer.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <thread>

namespace {

using namespace std::chrono_literals;
using roadcast::cache::CacheEntry;
using roadcast::cache::MemoryCacheLayer;

CacheEntry Entry(const std::string& key, std::chrono::milliseconds lifetime) {
  const auto now = roadcast::util::Now();
  return CacheEntry{key, "payload-" + key, now, now + lifetime, "g"};
}

void TestPutGetRemove() {
  MemoryCacheLayer layer(10);
  layer.Put(Entry("a", 1h), std::nullopt);

  auto hit = layer.Get("a");
  assert(hit.has_value());
  assert(hit->payload == "payload-a");

  assert(layer.Remove("a"));
  assert(!layer.Remove("a"));
  assert(!layer.Get("a").has_value());
}

void TestTtlHidesEntryBeforeItsExpiry() {
  MemoryCacheLayer layer(10);
  layer.Put(Entry("a", 1h), 30ms);
  assert(layer.Get("a").has_value());

  std::this_thread::sleep_for(60ms);
  assert(!layer.Get("a").has_value());
}

void TestFullLayerEvictsNearestDeadline() {
  MemoryCacheLayer layer(2);
  layer.Put(Entry("soon", 1min), std::nullopt);
  layer.Put(Entry("late", 1h), std::nullopt);
  layer.Put(Entry("new", 30min), std::nullopt);

  assert(layer.Size() == 2);
  assert(!layer.Get("soon").has_value());
  assert(layer.Get("late").has_value());
  assert(layer.Get("new").has_value());
}

void TestOverwriteKeepsOneSlot() {
  MemoryCacheLayer layer(2);
  layer.Put(Entry("a", 1h), std::nullopt);
  auto replacement    = Entry("a", 2h);
  replacement.payload = "second";
  layer.Put(replacement, std::nullopt);

  assert(layer.Size() == 1);
  assert(layer.Get("a")->payload == "second");
}

void TestRemoveExpired() {
  MemoryCacheLayer layer(10);
  layer.Put(Entry("short", 10ms), std::nullopt);
  layer.Put(Entry("long", 1h), std::nullopt);

  std::this_thread::sleep_for(30ms);
  assert(layer.RemoveExpired(roadcast::util::Now()) == 1);
  assert(layer.Size() == 1);
  assert(layer.Get("long").has_value());
}

} // namespace

int main() {
  TestPutGetRemove();
  TestTtlHidesEntryBeforeItsExpiry();
  TestFullLayerEvictsNearestDeadline();
  TestOverwriteKeepsOneSlot();
  TestRemoveExpired();

  std::cout << "memory_cache_layer_test: pass" << std::endl;
  return 0;
}
