#pragma once

#include <condition_variable>
#include <functional>
#include <mutex>
#include <optional>
#include <queue>

namespace roadcast::runtime {

/*
  Thread-safe blocking queue for pool workers.
*/
class TaskQueue {
 public:
  using Task = std::function<void()>;

  // Returns false once Shutdown() has been called.
  bool Enqueue(Task task);

  // Blocks; nullopt after shutdown once the queue has drained.
  std::optional<Task> Dequeue();

  void Shutdown();

 private:
  std::mutex              mutex_;
  std::condition_variable cv_;
  std::queue<Task>        queue_;
  bool                    shutdown_ = false;
};

} // namespace roadcast::runtime
