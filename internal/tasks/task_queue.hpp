#pragma once

#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <optional>
#include <queue>
#include <string>

namespace modsync::tasks {

/*
  A detached unit of work. Its failure is logged by the worker, never
  reported back to whoever scheduled it.
*/
struct Task {
  std::string           name;
  std::function<void()> fn;
};

/*
  Thread-safe blocking queue for background workers.
*/
class TaskQueue {
 public:
  // Returns false once the queue has been shut down.
  bool Enqueue(Task task);

  // blocking wait
  std::optional<Task> Dequeue();

  // Called by the worker after a dequeued task finished.
  void MarkDone();

  // Blocks until every enqueued task has finished.
  void WaitIdle();

  void Shutdown();

  std::size_t Outstanding() const;

 private:
  mutable std::mutex      mutex_;
  std::condition_variable cv_;
  std::condition_variable idle_cv_;
  std::queue<Task>        queue_;
  std::size_t             outstanding_ = 0;
  bool                    shutdown_    = false;
};

} // namespace modsync::tasks
