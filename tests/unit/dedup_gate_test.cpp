#include "internal/cache/dedup_gate.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>

namespace {

using namespace std::chrono_literals;
using roadcast::cache::DedupGate;
using roadcast::cache::Role;

void TestFirstCallerLeadsOthersFollow() {
  DedupGate gate;

  auto leader   = gate.Acquire("k", 10s);
  auto follower = gate.Acquire("k", 10s);
  assert(leader.role == Role::kLeader);
  assert(follower.role == Role::kFollower);

  gate.Release(leader);
  assert(gate.Wait(follower, DedupGate::SteadyClock::now() + 1s));

  // The key is free again.
  auto next = gate.Acquire("k", 10s);
  assert(next.role == Role::kLeader);
  gate.Release(next);

  const auto stats = gate.Stats();
  assert(stats.leaders == 2);
  assert(stats.followers == 1);
}

void TestCrashedLeaderLockExpires() {
  DedupGate gate;

  // Leader acquires and never releases.
  auto crashed = gate.Acquire("k", 50ms);
  assert(crashed.role == Role::kLeader);

  auto follower = gate.Acquire("k", 50ms);
  assert(follower.role == Role::kFollower);

  // The follower is woken by the lock's own expiry, well before its deadline.
  const auto started = DedupGate::SteadyClock::now();
  assert(gate.Wait(follower, started + 5s));
  assert(DedupGate::SteadyClock::now() - started < 2s);

  auto successor = gate.Acquire("k", 10s);
  assert(successor.role == Role::kLeader);
  assert(gate.Stats().expired_locks == 1);

  // A stale release from the crashed leader does not free the successor's lock.
  gate.Release(crashed);
  assert(gate.Acquire("k", 10s).role == Role::kFollower);
  gate.Release(successor);
}

void TestFollowerTimesOut() {
  DedupGate gate;

  auto leader   = gate.Acquire("k", 10s);
  auto follower = gate.Acquire("k", 10s);

  assert(!gate.Wait(follower, DedupGate::SteadyClock::now() + 30ms));
  assert(gate.Stats().follower_timeouts == 1);
  gate.Release(leader);
}

void TestReadThroughFetchesOnce() {
  DedupGate                   gate;
  roadcast::config::GateOptions options;

  std::mutex         mutex;
  std::optional<int> cached;
  std::atomic<int>   fetches{0};

  auto lookup = [&]() -> std::optional<int> {
    std::lock_guard lock(mutex);
    return cached;
  };
  auto fetch = [&]() -> int {
    fetches++;
    std::this_thread::sleep_for(50ms);
    std::lock_guard lock(mutex);
    cached = 7;
    return 7;
  };

  std::vector<std::thread> threads;
  std::atomic<int>         sum{0};
  for (int i = 0; i < 20; ++i) {
    threads.emplace_back([&] { sum += roadcast::cache::ReadThrough(gate, "k", options, lookup, fetch); });
  }
  for (auto& t : threads) t.join();

  assert(fetches.load() == 1);
  assert(sum.load() == 20 * 7);
}

void TestLeaderFailureLetsFollowerRetry() {
  DedupGate                   gate;
  roadcast::config::GateOptions options;

  std::atomic<int> attempts{0};
  auto             lookup = []() -> std::optional<int> { return std::nullopt; };
  auto             fetch  = [&]() -> int {
    if (attempts++ == 0) throw std::runtime_error("origin down");
    return 1;
  };

  bool threw = false;
  try {
    roadcast::cache::ReadThrough(gate, "k", options, lookup, fetch);
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);

  // The guard released the lock, so the next caller leads immediately.
  assert(roadcast::cache::ReadThrough(gate, "k", options, lookup, fetch) == 1);
}

} // namespace

int main() {
  TestFirstCallerLeadsOthersFollow();
  TestCrashedLeaderLockExpires();
  TestFollowerTimesOut();
  TestReadThroughFetchesOnce();
  TestLeaderFailureLetsFollowerRetry();

  std::cout << "dedup_gate_test: pass" << std::endl;
  return 0;
}
