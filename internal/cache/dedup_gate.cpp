#include "dedup_gate.hpp"

#include <algorithm>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/token.hpp"

namespace roadcast::cache {

using roadcast::observability::StringField;

GateTicket DedupGate::Acquire(const std::string& key, std::chrono::milliseconds leader_lock_ttl) {
  std::lock_guard lock(mutex_);

  const auto now = SteadyClock::now();
  auto       it  = locks_.find(key);

  if (it != locks_.end() && it->second.expires_at > now) {
    followers_++;
    observability::Metrics::Instance().RecordGateRole("follower");
    return GateTicket{Role::kFollower, key, it->second.token, it->second.epoch};
  }

  if (it != locks_.end()) {
    expired_locks_++;
    observability::Metrics::Instance().RecordGateRole("expired_lock");
    ROADCAST_LOG_WARN("leader lock expired, taking over", {StringField("key", key)});
  }

  Lock held;
  held.token      = util::RandomToken();
  held.expires_at = now + leader_lock_ttl;
  held.epoch      = next_epoch_++;
  locks_[key]     = held;

  leaders_++;
  observability::Metrics::Instance().RecordGateRole("leader");

  // Followers parked on the expired lock can re-check now.
  if (it != locks_.end()) released_.notify_all();

  return GateTicket{Role::kLeader, key, held.token, held.epoch};
}

void DedupGate::Release(const GateTicket& ticket) {
  if (ticket.role != Role::kLeader) return;

  {
    std::lock_guard lock(mutex_);
    auto            it = locks_.find(ticket.key);
    if (it == locks_.end() || it->second.token != ticket.token) return;
    locks_.erase(it);
  }
  released_.notify_all();
}

bool DedupGate::HeldLocked(const GateTicket& ticket, SteadyClock::time_point now) const {
  auto it = locks_.find(ticket.key);
  return it != locks_.end() && it->second.epoch == ticket.epoch && it->second.expires_at > now;
}

bool DedupGate::Wait(const GateTicket& ticket, SteadyClock::time_point deadline) {
  std::unique_lock lock(mutex_);

  for (;;) {
    const auto now = SteadyClock::now();
    if (!HeldLocked(ticket, now)) return true;

    if (now >= deadline) {
      follower_timeouts_++;
      observability::Metrics::Instance().RecordGateRole("follower_timeout");
      ROADCAST_LOG_WARN("follower wait timed out, fetching independently", {StringField("key", ticket.key)});
      return false;
    }

    // Wake at the lock's own expiry too, so a dead leader is noticed.
    const auto lock_expiry = locks_.find(ticket.key)->second.expires_at;
    released_.wait_until(lock, std::min(deadline, lock_expiry));
  }
}

GateCounters DedupGate::Stats() const {
  GateCounters out;
  out.leaders           = leaders_.load();
  out.followers         = followers_.load();
  out.follower_timeouts = follower_timeouts_.load();
  out.expired_locks     = expired_locks_.load();
  return out;
}

} // namespace roadcast::cache
