#pragma once

#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <vector>

#include "internal/queue/job_context.hpp"

namespace sandbox::queue {

// Success is returning; any exception is a failure for the dispatcher to classify.
using JobHandler = std::function<void(JobContext&)>;

class HandlerRegistry {
 public:
  // AlreadyExists when a handler is registered for `type`.
  void Register(const std::string& type, JobHandler handler);

  // Empty function when nothing handles `type`.
  JobHandler Find(const std::string& type) const;

  std::vector<std::string> Types() const;

 private:
  mutable std::mutex                mutex_;
  std::map<std::string, JobHandler> handlers_;
};

} // namespace sandbox::queue
