#pragma once

#include <atomic>
#include <memory>
#include <string>
#include <thread>
#include <functional>

#include "task_queue.hpp"

namespace modsync::tasks {

/*
  Background worker that runs detached tasks.

  Executes:
      thumbnail write-back
      post-toggle resync
*/
class BackgroundWorker {
 public:
  explicit BackgroundWorker(std::shared_ptr<TaskQueue> queue);
  ~BackgroundWorker();

  BackgroundWorker(const BackgroundWorker&)            = delete;
  BackgroundWorker& operator=(const BackgroundWorker&) = delete;

  void Start();

  // Finishes queued tasks, then joins.
  void Stop();

  // Returns false if the worker is stopping and the task was dropped.
  bool Submit(std::string name, std::function<void()> fn);

  void Drain();

 private:
  void Run();

  std::shared_ptr<TaskQueue> queue_;

  std::thread       thread_;
  std::atomic<bool> running_{false};
};

} // namespace modsync::tasks
