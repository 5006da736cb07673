#include "memory_cache_layer.hpp"

#include <algorithm>
#include <mutex>

namespace roadcast::cache {

MemoryCacheLayer::MemoryCacheLayer(std::size_t max_entries) : max_entries_(max_entries == 0 ? 1 : max_entries) {
}

std::optional<CacheEntry> MemoryCacheLayer::Get(const std::string& key) {
  std::shared_lock lock(mutex_);

  auto it = entries_.find(key);
  if (it == entries_.end()) return std::nullopt;

  // Left in place for RemoveExpired/Put to reclaim.
  if (it->second.evict_at <= util::Now()) return std::nullopt;

  return it->second.entry;
}

void MemoryCacheLayer::Put(const CacheEntry& entry, std::optional<std::chrono::milliseconds> ttl) {
  auto evict_at = entry.expires_at;
  if (ttl) {
    evict_at = std::min(evict_at, util::Now() + *ttl);
  }

  std::unique_lock lock(mutex_);

  if (auto it = entries_.find(entry.key); it != entries_.end()) {
    EraseLocked(it);
  }

  while (entries_.size() >= max_entries_ && !by_deadline_.empty()) {
    EraseLocked(entries_.find(by_deadline_.begin()->second));
  }

  entries_.emplace(entry.key, Slot{entry, evict_at});
  by_deadline_.emplace(evict_at, entry.key);
}

bool MemoryCacheLayer::Remove(const std::string& key) {
  std::unique_lock lock(mutex_);

  auto it = entries_.find(key);
  if (it == entries_.end()) return false;

  EraseLocked(it);
  return true;
}

std::uint64_t MemoryCacheLayer::RemoveExpired(util::TimePoint cutoff) {
  std::unique_lock lock(mutex_);

  std::uint64_t removed = 0;
  while (!by_deadline_.empty() && by_deadline_.begin()->first <= cutoff) {
    EraseLocked(entries_.find(by_deadline_.begin()->second));
    ++removed;
  }
  return removed;
}

std::size_t MemoryCacheLayer::Size() const {
  std::shared_lock lock(mutex_);
  return entries_.size();
}

void MemoryCacheLayer::EraseLocked(std::unordered_map<std::string, Slot>::iterator it) {
  by_deadline_.erase({it->second.evict_at, it->first});
  entries_.erase(it);
}

} // namespace roadcast::cache
