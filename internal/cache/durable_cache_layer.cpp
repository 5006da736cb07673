#include "durable_cache_layer.hpp"

#include "internal/util/errors.hpp"

namespace roadcast::cache {

namespace {

db::model::CacheEntryRecord ToRecord(const CacheEntry& entry) {
  db::model::CacheEntryRecord r;
  r.key           = entry.key;
  r.payload       = entry.payload;
  r.created_at_ms = util::ToUnixMillis(entry.created_at);
  r.expires_at_ms = util::ToUnixMillis(entry.expires_at);
  r.generation    = entry.generation;
  return r;
}

CacheEntry FromRecord(const db::model::CacheEntryRecord& r) {
  CacheEntry entry;
  entry.key        = r.key;
  entry.payload    = r.payload;
  entry.created_at = util::FromUnixMillis(r.created_at_ms);
  entry.expires_at = util::FromUnixMillis(r.expires_at_ms);
  entry.generation = r.generation;
  return entry;
}

// Attempts for a write that hit lock contention.
constexpr int kWriteAttempts = 2;

[[noreturn]] void Down(const std::string& op, const std::string& detail) {
  throw util::CacheLayerDown("durable cache " + op + ": " + detail);
}

[[noreturn]] void Down(const std::string& op, const db::Result& result) {
  Down(op, std::string(db::ToString(result.code)) + " " + result.message);
}

} // namespace

DurableCacheLayer::DurableCacheLayer(std::shared_ptr<db::Repository> repo) : repo_(std::move(repo)) {
}

std::optional<CacheEntry> DurableCacheLayer::Get(const std::string& key) {
  try {
    auto tx     = repo_->Begin();
    auto record = repo_->GetCacheEntry(*tx, key);
    tx->Commit();
    if (!record) return std::nullopt;
    return FromRecord(*record);
  } catch (const std::exception& e) {
    Down("get", e.what());
  }
}

// The durable copy keeps the entry's own expiry; ttl only shapes fast tiers.
void DurableCacheLayer::Put(const CacheEntry& entry, std::optional<std::chrono::milliseconds>) {
  const auto record = ToRecord(entry);
  db::Result result;
  for (int attempt = 0; attempt < kWriteAttempts; ++attempt) {
    try {
      auto tx = repo_->Begin();
      result  = repo_->UpsertCacheEntry(*tx, record);
      if (result) tx->Commit();
    } catch (const std::exception& e) {
      Down("put", e.what());
    }
    if (!result.Retryable()) break;
  }
  if (!result) Down("put", result);
}

bool DurableCacheLayer::Remove(const std::string& key) {
  db::Result result;
  try {
    auto tx = repo_->Begin();
    result  = repo_->DeleteCacheEntry(*tx, key);
    if (result) tx->Commit();
  } catch (const std::exception& e) {
    Down("remove", e.what());
  }

  if (result) return true;
  if (result.code == db::ErrorCode::NotFound) return false;
  Down("remove", result);
}

std::uint64_t DurableCacheLayer::RemoveExpired(util::TimePoint cutoff) {
  db::Result    result;
  std::uint64_t removed = 0;
  try {
    auto tx = repo_->Begin();
    result  = repo_->DeleteCacheEntriesExpiredBefore(*tx, util::ToUnixMillis(cutoff), removed);
    if (result) tx->Commit();
  } catch (const std::exception& e) {
    Down("purge", e.what());
  }
  if (!result) Down("purge", result);
  return removed;
}

} // namespace roadcast::cache
