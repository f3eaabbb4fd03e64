#include "background_worker.hpp"

#include "internal/observability/logging.hpp"

namespace modsync::tasks {

BackgroundWorker::BackgroundWorker(std::shared_ptr<TaskQueue> queue) : queue_(std::move(queue)) {
}

BackgroundWorker::~BackgroundWorker() {
  Stop();
}

void BackgroundWorker::Start() {
  if (running_.exchange(true)) return;
  thread_ = std::thread(&BackgroundWorker::Run, this);
}

void BackgroundWorker::Stop() {
  queue_->Shutdown();
  running_ = false;
  if (thread_.joinable())
    thread_.join();
}

bool BackgroundWorker::Submit(std::string name, std::function<void()> fn) {
  if (!queue_->Enqueue(Task{name, std::move(fn)})) {
    MODSYNC_LOG_WARN("Background task dropped after shutdown", {modsync::observability::StringField("task", name)});
    return false;
  }
  return true;
}

void BackgroundWorker::Drain() {
  queue_->WaitIdle();
}

void BackgroundWorker::Run() {
  // Drains the queue even after Stop() so detached work is not lost.
  for (;;) {
    auto task = queue_->Dequeue();
    if (!task)
      break;

    try {
      task->fn();
    }
    catch (const std::exception& e) {
      MODSYNC_LOG_WARN("Background task failed", {modsync::observability::StringField("task", task->name),
                                                  modsync::observability::StringField("error", e.what())});
    }
    queue_->MarkDone();
  }
}

} // namespace modsync::tasks
