#pragma once

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_set>
#include <vector>

#include "internal/queue/handler_registry.hpp"
#include "internal/queue/job_store.hpp"
#include "internal/queue/work_queue.hpp"

namespace sandbox::runtime::config {
class RuntimeConfig;
}

namespace sandbox::queue {

struct DispatcherOptions {
  std::string worker_id;
  uint64_t    poll_interval_ms        = 250;
  uint64_t    lease_ms                = 60000;
  uint64_t    lease_renew_interval_ms = 5000;
  std::size_t worker_threads          = 4;

  static DispatcherOptions FromConfig(const sandbox::runtime::config::RuntimeConfig& config);
};

/*
  Dispatcher

  One poll thread claims runnable jobs and hands them to a fixed worker
  pool; one renewal thread extends the lease of every job in flight.
  The global concurrency limit and the pause flag live in the database,
  so several dispatchers can share one queue.

  Outcome of a handler run:
    return              -> succeeded
    JobRescheduled      -> queued again at now+delay, attempt not counted
    JobCancelled        -> cancelled
    PermanentJobError   -> failed
    any other exception -> retry with backoff until max attempts
*/
class Dispatcher {
 public:
  Dispatcher(std::shared_ptr<JobStore> store, std::shared_ptr<HandlerRegistry> handlers, DispatcherOptions options,
             util::NowFn now = util::Now);
  ~Dispatcher();

  Dispatcher(const Dispatcher&)            = delete;
  Dispatcher& operator=(const Dispatcher&) = delete;

  void Start();

  // Stops claiming, lets in-flight jobs finish, joins every thread.
  void Stop();

  // One claim cycle; returns how many jobs were handed to the workers.
  std::size_t PollOnce();

  // Runs one claimed job on the calling thread and records its outcome.
  void Execute(const JobRecord& job);

  // Renews the lease of every in-flight job once.
  void RenewLeases();

  std::size_t InFlight() const;

  const std::string& WorkerId() const {
    return options_.worker_id;
  }

 private:
  void PollLoop();
  void WorkerLoop();
  void RenewLoop();

  void Track(const std::string& id);
  void Untrack(const std::string& id);

  std::shared_ptr<JobStore>        store_;
  std::shared_ptr<HandlerRegistry> handlers_;
  DispatcherOptions                options_;
  util::NowFn                      now_;

  WorkQueue work_;

  mutable std::mutex              mutex_;
  std::condition_variable         wake_;
  std::unordered_set<std::string> in_flight_;
  std::atomic<bool>               running_{false};

  std::thread              poll_thread_;
  std::thread              renew_thread_;
  std::vector<std::thread> workers_;
};

} // namespace sandbox::queue
