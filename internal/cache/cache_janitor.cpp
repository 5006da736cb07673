#include "cache_janitor.hpp"

#include "internal/observability/logging.hpp"

namespace roadcast::cache {

CacheJanitor::CacheJanitor(std::shared_ptr<TieredCache> cache, std::chrono::milliseconds interval, std::chrono::milliseconds stale_grace)
    : cache_(std::move(cache)), interval_(interval), stale_grace_(stale_grace) {
}

CacheJanitor::~CacheJanitor() {
  Stop();
}

void CacheJanitor::Start() {
  if (running_.exchange(true)) return;
  thread_ = std::thread(&CacheJanitor::Loop, this);
}

void CacheJanitor::Stop() {
  {
    std::lock_guard lock(mutex_);
    running_ = false;
  }
  wake_.notify_all();
  if (thread_.joinable()) thread_.join();
}

std::uint64_t CacheJanitor::RunOnce() {
  const auto removed = cache_->PurgeExpired(util::Now() - stale_grace_);
  if (removed > 0) {
    ROADCAST_LOG_INFO("purged expired cache entries", {roadcast::observability::IntField("removed", static_cast<std::int64_t>(removed)),
                                                       roadcast::observability::DurationField("stale_grace", stale_grace_)});
  }
  return removed;
}

void CacheJanitor::Loop() {
  std::unique_lock lock(mutex_);
  while (running_) {
    wake_.wait_for(lock, interval_, [this] { return !running_; });
    if (!running_) break;

    lock.unlock();
    try {
      RunOnce();
    } catch (const std::exception& e) {
      ROADCAST_LOG_ERROR("cache purge pass failed", {roadcast::observability::StringField("error", e.what())});
    }
    lock.lock();
  }
}

} // namespace roadcast::cache
