#include "work_queue.hpp"

namespace sandbox::queue {

void WorkQueue::Enqueue(db::model::JobRecord job) {
  {
    std::lock_guard lock(mutex_);
    queue_.push(std::move(job));
  }
  cv_.notify_one();
}

std::optional<db::model::JobRecord> WorkQueue::Dequeue() {
  std::unique_lock lock(mutex_);

  cv_.wait(lock, [&] { return shutdown_ || !queue_.empty(); });

  if (shutdown_ && queue_.empty()) return std::nullopt;

  auto job = std::move(queue_.front());
  queue_.pop();
  return job;
}

void WorkQueue::Shutdown() {
  {
    std::lock_guard lock(mutex_);
    shutdown_ = true;
  }
  cv_.notify_all();
}

std::size_t WorkQueue::Size() const {
  std::lock_guard lock(mutex_);
  return queue_.size();
}

} // namespace sandbox::queue
