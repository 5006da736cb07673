#pragma once

#include <cstddef>
#include <future>
#include <memory>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <vector>

#include "task_queue.hpp"

namespace roadcast::runtime {

/*
  Fixed set of worker threads draining one TaskQueue.

  Submit() returns a future; exceptions thrown by the task surface from
  future.get() on the caller's side.
*/
class WorkerPool {
 public:
  explicit WorkerPool(std::size_t workers);
  ~WorkerPool();

  WorkerPool(const WorkerPool&)            = delete;
  WorkerPool& operator=(const WorkerPool&) = delete;

  template <typename F>
  auto Submit(F&& f) -> std::future<std::invoke_result_t<F>> {
    using R   = std::invoke_result_t<F>;
    auto task = std::make_shared<std::packaged_task<R()>>(std::forward<F>(f));
    auto fut  = task->get_future();
    if (!queue_.Enqueue([task] { (*task)(); })) {
      throw std::runtime_error("worker pool is stopped");
    }
    return fut;
  }

  void Stop();

 private:
  void Run();

  TaskQueue                queue_;
  std::vector<std::thread> threads_;
};

} // namespace roadcast::runtime
