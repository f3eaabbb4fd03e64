#include "task_queue.hpp"

namespace modsync::tasks {

bool TaskQueue::Enqueue(Task task) {
  {
    std::lock_guard lock(mutex_);
    if (shutdown_) return false;
    queue_.push(std::move(task));
    ++outstanding_;
  }
  cv_.notify_one();
  return true;
}

std::optional<Task> TaskQueue::Dequeue() {
  std::unique_lock lock(mutex_);

  cv_.wait(lock, [&] { return shutdown_ || !queue_.empty(); });

  if (shutdown_ && queue_.empty()) return std::nullopt;

  Task task = std::move(queue_.front());
  queue_.pop();
  return task;
}

void TaskQueue::MarkDone() {
  {
    std::lock_guard lock(mutex_);
    if (outstanding_ > 0) --outstanding_;
    if (outstanding_ > 0) return;
  }
  idle_cv_.notify_all();
}

void TaskQueue::WaitIdle() {
  std::unique_lock lock(mutex_);
  idle_cv_.wait(lock, [&] { return outstanding_ == 0; });
}

void TaskQueue::Shutdown() {
  {
    std::lock_guard lock(mutex_);
    shutdown_ = true;
  }
  cv_.notify_all();
}

std::size_t TaskQueue::Outstanding() const {
  std::lock_guard lock(mutex_);
  return outstanding_;
}

} // namespace modsync::tasks
