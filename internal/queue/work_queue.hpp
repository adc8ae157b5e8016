#pragma once

#include <condition_variable>
#include <mutex>
#include <optional>
#include <queue>

#include "internal/db/model/job_record.hpp"

namespace sandbox::queue {

/*
  Thread-safe blocking queue between the claim loop and the workers.
*/
class WorkQueue {
 public:
  void Enqueue(db::model::JobRecord job);

  // blocking wait; nullopt once shut down and drained
  std::optional<db::model::JobRecord> Dequeue();

  void Shutdown();

  std::size_t Size() const;

 private:
  mutable std::mutex               mutex_;
  std::condition_variable          cv_;
  std::queue<db::model::JobRecord> queue_;
  bool                             shutdown_ = false;
};

} // namespace sandbox::queue
