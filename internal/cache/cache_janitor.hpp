#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <thread>

#include "tiered_cache.hpp"

namespace roadcast::cache {

/*
  Periodically drops cache entries that are past expiry plus stale_grace,
  so the stale fallback keeps its window while the durable table stays
  bounded.
*/
class CacheJanitor {
 public:
  CacheJanitor(std::shared_ptr<TieredCache> cache, std::chrono::milliseconds interval, std::chrono::milliseconds stale_grace);
  ~CacheJanitor();

  void Start();
  void Stop();

  // One purge pass; also used by the admin PurgeExpired operation.
  std::uint64_t RunOnce();

 private:
  void Loop();

  std::shared_ptr<TieredCache> cache_;
  std::chrono::milliseconds    interval_;
  std::chrono::milliseconds    stale_grace_;

  std::mutex              mutex_;
  std::condition_variable wake_;
  std::thread             thread_;
  std::atomic<bool>       running_{false};
};

} // namespace roadcast::cache
