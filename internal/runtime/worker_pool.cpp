#include "worker_pool.hpp"

namespace roadcast::runtime {

WorkerPool::WorkerPool(std::size_t workers) {
  if (workers == 0) workers = 1;
  threads_.reserve(workers);
  for (std::size_t i = 0; i < workers; ++i) {
    threads_.emplace_back(&WorkerPool::Run, this);
  }
}

WorkerPool::~WorkerPool() {
  Stop();
}

void WorkerPool::Stop() {
  queue_.Shutdown();
  for (auto& t : threads_) {
    if (t.joinable()) t.join();
  }
  threads_.clear();
}

void WorkerPool::Run() {
  // packaged_task captures task exceptions into the future.
  while (auto task = queue_.Dequeue()) {
    (*task)();
  }
}

} // namespace roadcast::runtime
