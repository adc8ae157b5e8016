#include "dispatcher.hpp"

#include <chrono>

#include "config/config.pb.h"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/uuid.hpp"

namespace sandbox::queue {

using observability::IntField;
using observability::StringField;

DispatcherOptions DispatcherOptions::FromConfig(const sandbox::runtime::config::RuntimeConfig& config) {
  const auto&       d = config.dispatcher();
  DispatcherOptions options;
  options.worker_id = d.worker_id();
  if (d.poll_interval_ms() > 0) options.poll_interval_ms = d.poll_interval_ms();
  if (d.lease_ms() > 0) options.lease_ms = d.lease_ms();
  if (d.lease_renew_interval_ms() > 0) options.lease_renew_interval_ms = d.lease_renew_interval_ms();
  if (d.worker_threads() > 0) options.worker_threads = d.worker_threads();
  return options;
}

Dispatcher::Dispatcher(std::shared_ptr<JobStore> store, std::shared_ptr<HandlerRegistry> handlers, DispatcherOptions options,
                       util::NowFn now)
    : store_(std::move(store)), handlers_(std::move(handlers)), options_(std::move(options)), now_(std::move(now)) {
  if (options_.worker_id.empty()) {
    options_.worker_id = "worker-" + util::RandomSuffix();
  }
  if (options_.worker_threads == 0) {
    options_.worker_threads = 1;
  }
}

Dispatcher::~Dispatcher() {
  Stop();
}

void Dispatcher::Start() {
  if (running_.exchange(true)) return;

  for (std::size_t i = 0; i < options_.worker_threads; ++i) {
    workers_.emplace_back(&Dispatcher::WorkerLoop, this);
  }
  poll_thread_  = std::thread(&Dispatcher::PollLoop, this);
  renew_thread_ = std::thread(&Dispatcher::RenewLoop, this);

  SANDBOX_LOG_INFO("dispatcher started", {StringField("worker_id", options_.worker_id),
                                          IntField("worker_threads", static_cast<int64_t>(options_.worker_threads)),
                                          IntField("poll_interval_ms", static_cast<int64_t>(options_.poll_interval_ms))});
}

void Dispatcher::Stop() {
  if (!running_.exchange(false)) return;

  wake_.notify_all();
  if (poll_thread_.joinable()) poll_thread_.join();

  work_.Shutdown();
  for (auto& worker : workers_) {
    if (worker.joinable()) worker.join();
  }
  workers_.clear();

  wake_.notify_all();
  if (renew_thread_.joinable()) renew_thread_.join();

  SANDBOX_LOG_INFO("dispatcher stopped", {StringField("worker_id", options_.worker_id)});
}

std::size_t Dispatcher::InFlight() const {
  std::lock_guard lock(mutex_);
  return in_flight_.size();
}

void Dispatcher::Track(const std::string& id) {
  std::lock_guard lock(mutex_);
  in_flight_.insert(id);
}

void Dispatcher::Untrack(const std::string& id) {
  std::lock_guard lock(mutex_);
  in_flight_.erase(id);
}

std::size_t Dispatcher::PollOnce() {
  const auto busy = InFlight();
  if (busy >= options_.worker_threads) return 0;

  auto claimed = store_->ClaimJobs(options_.worker_id, options_.lease_ms, options_.worker_threads - busy);
  for (auto& job : claimed) {
    Track(job.id);
    work_.Enqueue(std::move(job));
  }
  return claimed.size();
}

void Dispatcher::PollLoop() {
  while (running_) {
    try {
      PollOnce();
    } catch (const std::exception& e) {
      SANDBOX_LOG_ERROR("job claim failed", {StringField("error", e.what())});
    }

    std::unique_lock lock(mutex_);
    wake_.wait_for(lock, std::chrono::milliseconds(options_.poll_interval_ms), [this] { return !running_; });
  }
}

void Dispatcher::WorkerLoop() {
  for (;;) {
    auto job = work_.Dequeue();
    if (!job) break;

    try {
      Execute(*job);
    } catch (const std::exception& e) {
      SANDBOX_LOG_ERROR("job outcome not recorded", {StringField("job_id", job->id), StringField("error", e.what())});
    }
    Untrack(job->id);
  }
}

void Dispatcher::RenewLeases() {
  std::vector<std::string> ids;
  {
    std::lock_guard lock(mutex_);
    ids.assign(in_flight_.begin(), in_flight_.end());
  }

  for (const auto& id : ids) {
    try {
      if (!store_->RenewLease(id, options_.worker_id, options_.lease_ms)) {
        SANDBOX_LOG_WARN("job lease not renewed", {StringField("job_id", id)});
      }
    } catch (const std::exception& e) {
      SANDBOX_LOG_ERROR("job lease renewal failed", {StringField("job_id", id), StringField("error", e.what())});
    }
  }
}

void Dispatcher::RenewLoop() {
  for (;;) {
    {
      std::unique_lock lock(mutex_);
      auto drained = [this] { return !running_ && in_flight_.empty(); };
      if (wake_.wait_for(lock, std::chrono::milliseconds(options_.lease_renew_interval_ms), drained)) break;
    }
    RenewLeases();
  }
}

namespace {

// What a handler run ended with, before anything is written back.
struct HandlerResult {
  enum class Kind { kSucceeded, kRescheduled, kCancelled, kPermanent, kFailed };

  Kind        kind     = Kind::kSucceeded;
  uint64_t    delay_ms = 0;
  std::string error;
};

HandlerResult RunHandler(const JobHandler& handler, JobContext& context) {
  HandlerResult result;
  try {
    handler(context);
  } catch (const JobRescheduled& r) {
    result.kind     = HandlerResult::Kind::kRescheduled;
    result.delay_ms = r.DelayMs();
  } catch (const JobCancelled&) {
    result.kind = HandlerResult::Kind::kCancelled;
  } catch (const PermanentJobError& e) {
    result.kind  = HandlerResult::Kind::kPermanent;
    result.error = e.what();
  } catch (const std::exception& e) {
    result.kind  = HandlerResult::Kind::kFailed;
    result.error = e.what();
  }
  return result;
}

} // namespace

/*
  Only the handler call is guarded. A store failure while recording the
  outcome propagates to WorkerLoop; the job keeps its lease and becomes
  reclaimable once that expires.
*/
void Dispatcher::Execute(const JobRecord& job) {
  observability::SpanScope span("job." + job.type);
  span.SetAttribute("job.id", job.id);
  span.SetAttribute("project.id", job.project_id);

  const auto  started = std::chrono::steady_clock::now();
  std::string outcome;

  auto handler = handlers_->Find(job.type);
  if (!handler) {
    store_->MarkFailedPermanently(job.id, options_.worker_id, "no handler registered for job type " + job.type);
    outcome = "failed";
  } else {
    JobContext context(job, *store_, now_);
    const auto result = RunHandler(handler, context);

    switch (result.kind) {
      case HandlerResult::Kind::kSucceeded:
        store_->MarkSucceeded(job.id, options_.worker_id);
        outcome = "succeeded";
        break;
      case HandlerResult::Kind::kRescheduled:
        store_->Reschedule(job.id, options_.worker_id, result.delay_ms);
        outcome = "rescheduled";
        break;
      case HandlerResult::Kind::kCancelled:
        store_->MarkCancelled(job.id, options_.worker_id);
        outcome = "cancelled";
        break;
      case HandlerResult::Kind::kPermanent:
        span.MarkFailed(result.error);
        store_->MarkFailedPermanently(job.id, options_.worker_id, result.error);
        outcome = "failed";
        break;
      case HandlerResult::Kind::kFailed: {
        span.MarkFailed(result.error);
        auto updated = store_->MarkFailedAttempt(job.id, options_.worker_id, result.error);
        outcome      = updated && updated->state == sandbox::model::JobState::kQueued ? "retried" : "failed";
        break;
      }
    }
  }

  const auto elapsed_ms = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started).count();
  span.SetAttribute("job.outcome", outcome);
  observability::Metrics::Instance().RecordJobOutcome(job.type, outcome);
  observability::Metrics::Instance().ObserveJobDurationMs(job.type, elapsed_ms);
}

} // namespace sandbox::queue
