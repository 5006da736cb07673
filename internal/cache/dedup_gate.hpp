#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <string>
#include <utility>
#include <unordered_map>

#include "internal/config/engine_options.hpp"

namespace roadcast::cache {

enum class Role { kLeader, kFollower };

// Result of Acquire(). A leader must hand its ticket back to Release().
struct GateTicket {
  Role          role = Role::kFollower;
  std::string   key;
  std::string   token;
  std::uint64_t epoch = 0;
};

struct GateCounters {
  std::uint64_t leaders           = 0;
  std::uint64_t followers         = 0;
  std::uint64_t follower_timeouts = 0;
  std::uint64_t expired_locks     = 0;
};

/*
  DedupGate

  Per-key leader election for origin fetches. The first caller for a key
  becomes leader and holds a lock that expires after leader_lock_ttl; a
  crashed or stuck leader therefore cannot block the key forever.

  Followers wait on a condition variable that is notified when any lock is
  released. Wait() returns when the lock it observed is gone (released,
  expired or re-acquired by someone else), or false at the deadline.
*/
class DedupGate {
 public:
  using SteadyClock = std::chrono::steady_clock;

  GateTicket Acquire(const std::string& key, std::chrono::milliseconds leader_lock_ttl);

  // No-op if the ticket no longer owns the lock (expired and taken over).
  void Release(const GateTicket& ticket);

  bool Wait(const GateTicket& ticket, SteadyClock::time_point deadline);

  GateCounters Stats() const;

 private:
  struct Lock {
    std::string             token;
    SteadyClock::time_point expires_at;
    std::uint64_t           epoch = 0;
  };

  bool HeldLocked(const GateTicket& ticket, SteadyClock::time_point now) const;

  mutable std::mutex                    mutex_;
  std::condition_variable               released_;
  std::unordered_map<std::string, Lock> locks_;
  std::uint64_t                         next_epoch_ = 1;

  std::atomic<std::uint64_t> leaders_{0};
  std::atomic<std::uint64_t> followers_{0};
  std::atomic<std::uint64_t> follower_timeouts_{0};
  std::atomic<std::uint64_t> expired_locks_{0};
};

// Releases a leader ticket on scope exit, including on exceptions.
class LeaderGuard {
 public:
  LeaderGuard(DedupGate& gate, GateTicket ticket) : gate_(gate), ticket_(std::move(ticket)) {
  }
  ~LeaderGuard() {
    gate_.Release(ticket_);
  }

  LeaderGuard(const LeaderGuard&)            = delete;
  LeaderGuard& operator=(const LeaderGuard&) = delete;

 private:
  DedupGate& gate_;
  GateTicket ticket_;
};

/*
  Singleflight read-through.

    lookup() -> std::optional<T>   cache read; a value means done
    fetch()  -> T                  origin call, populates the cache itself

  The leader re-checks lookup before fetching, since a previous leader may
  have finished between our miss and our acquire. A follower whose wait
  times out fetches on its own rather than failing.
*/
template <typename Lookup, typename Fetch>
auto ReadThrough(DedupGate& gate, const std::string& key, const config::GateOptions& options, Lookup&& lookup, Fetch&& fetch)
    -> decltype(fetch()) {
  for (;;) {
    if (auto hit = lookup()) {
      return std::move(*hit);
    }

    auto ticket = gate.Acquire(key, options.leader_lock_ttl);
    if (ticket.role == Role::kLeader) {
      LeaderGuard guard(gate, ticket);
      if (auto hit = lookup()) {
        return std::move(*hit);
      }
      return fetch();
    }

    const auto deadline = DedupGate::SteadyClock::now() + options.follower_wait_timeout;
    if (!gate.Wait(ticket, deadline)) {
      return fetch();
    }
  }
}

} // namespace roadcast::cache
