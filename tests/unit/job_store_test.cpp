#include "internal/queue/job_store.hpp"

#include <cassert>
#include <iostream>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/queue/job_enqueuer.hpp"
#include "internal/util/errors.hpp"
#include "support/fakes.hpp"

namespace {

using sandbox::model::JobState;
using sandbox::queue::EnqueueOptions;
using sandbox::queue::JobEnqueuer;
using sandbox::queue::JobStore;
using sandbox::testing::ManualClock;

constexpr uint64_t kLeaseMs = 60000;

struct Fixture {
  ManualClock                clock;
  std::shared_ptr<JobStore>  store;
  std::shared_ptr<JobEnqueuer> enqueuer;

  Fixture() {
    auto repository = std::make_shared<sandbox::db::memory::MemoryRepository>();
    store           = std::make_shared<JobStore>(repository, clock.Fn(), 3);
    enqueuer        = std::make_shared<JobEnqueuer>(store, clock.Fn());
  }
};

template <typename Exception, typename Fn>
bool Throws(Fn&& fn) {
  try {
    fn();
  } catch (const Exception&) {
    return true;
  }
  return false;
}

void TestBackoffAndSanitize() {
  assert(sandbox::queue::BackoffDelayMs(1) == 2000);
  assert(sandbox::queue::BackoffDelayMs(2) == 4000);
  assert(sandbox::queue::BackoffDelayMs(3) == 8000);
  assert(sandbox::queue::BackoffDelayMs(10) == 60000);

  const auto cleaned = sandbox::queue::SanitizeError("line1\nline2\ttab");
  assert(cleaned == "line1 line2 tab");
  assert(sandbox::queue::SanitizeError(std::string(2000, 'x')).size() == sandbox::queue::kMaxLastErrorSize);
}

void TestStopDedupesOnProjectKey() {
  Fixture f;

  const auto first  = f.enqueuer->EnqueueDockerStop("proj1", "idle");
  const auto second = f.enqueuer->EnqueueDockerStop("proj1", "user");

  assert(!first.deduplicated);
  assert(second.deduplicated);
  assert(first.job.id == second.job.id);
  assert(first.job.dedupe_key == "stop:proj1");

  sandbox::db::JobFilter filter;
  filter.type = "docker.stop";
  assert(f.store->CountJobs(filter) == 1);

  // A terminal job frees the key.
  f.store->Cancel(first.job.id);
  const auto third = f.enqueuer->EnqueueDockerStop("proj1", "idle");
  assert(!third.deduplicated);
  assert(third.job.id != first.job.id);
}

// Ids returned by `threads` x `per_thread` simultaneous stop requests for proj1.
std::set<std::string> EnqueueStopsConcurrently(JobEnqueuer& enqueuer, int threads, int per_thread) {
  std::mutex               mutex;
  std::set<std::string>    ids;
  std::vector<std::thread> workers;
  for (int t = 0; t < threads; ++t) {
    workers.emplace_back([&] {
      for (int i = 0; i < per_thread; ++i) {
        const auto result = enqueuer.EnqueueDockerStop("proj1", "idle");
        std::lock_guard<std::mutex> lock(mutex);
        ids.insert(result.job.id);
      }
    });
  }
  for (auto& worker : workers) worker.join();
  return ids;
}

void TestConcurrentEnqueuesShareOneJob() {
  Fixture f;

  const auto first = EnqueueStopsConcurrently(*f.enqueuer, 8, 25);
  assert(first.size() == 1);

  sandbox::db::JobFilter filter;
  filter.type = "docker.stop";
  assert(f.store->CountJobs(filter) == 1);

  // Once terminal, the next burst opens exactly one new job.
  f.store->Cancel(*first.begin());
  const auto second = EnqueueStopsConcurrently(*f.enqueuer, 8, 25);
  assert(second.size() == 1);
  assert(*second.begin() != *first.begin());
  assert(f.store->CountJobs(filter) == 2);

  filter.state = JobState::kQueued;
  assert(f.store->CountJobs(filter) == 1);
}

void TestStopCancelsPendingStart() {
  Fixture f;

  const auto start = f.enqueuer->EnqueueDockerStart("proj1", "presence");
  f.enqueuer->EnqueueDockerStop("proj1", "idle");

  const auto cancelled = f.store->GetJobById(start.job.id);
  assert(cancelled->state == JobState::kCancelled);
  assert(!cancelled->dedupe_active);
}

void TestClaimOrderAndPerProjectExclusivity() {
  Fixture f;
  f.store->SetConcurrency(10);

  EnqueueOptions low;
  low.project_id = "a";
  EnqueueOptions high;
  high.project_id = "b";
  high.priority   = 10;
  EnqueueOptions same_project;
  same_project.project_id = "a";

  const auto low_job  = f.store->Enqueue("t", "{}", low).job;
  f.clock.Advance(1);
  const auto high_job = f.store->Enqueue("t", "{}", high).job;
  f.clock.Advance(1);
  f.store->Enqueue("t", "{}", same_project);

  const auto claimed = f.store->ClaimJobs("w1", kLeaseMs, 10);
  assert(claimed.size() == 2);
  assert(claimed[0].id == high_job.id);
  assert(claimed[1].id == low_job.id);
  assert(claimed[0].state == JobState::kRunning);
  assert(claimed[0].locked_by == "w1");
  assert(*claimed[0].lock_expires_at_ms == f.clock.NowMs() + kLeaseMs);

  // Project "a" still has a running job.
  assert(f.store->ClaimJobs("w1", kLeaseMs, 10).empty());

  f.store->MarkSucceeded(low_job.id, "w1");
  const auto next = f.store->ClaimJobs("w1", kLeaseMs, 10);
  assert(next.size() == 1);
  assert(next[0].project_id == "a");
}

void TestConcurrencyLimitAndPause() {
  Fixture f;
  f.store->SetConcurrency(2);

  for (int i = 0; i < 5; ++i) {
    EnqueueOptions options;
    options.project_id = "p" + std::to_string(i);
    f.store->Enqueue("t", "{}", options);
  }

  assert(f.store->ClaimJobs("w1", kLeaseMs, 10).size() == 2);
  assert(f.store->ClaimJobs("w1", kLeaseMs, 10).empty());
  assert(f.store->CountRunning() == 2);

  f.store->SetConcurrency(4);
  f.store->SetPaused(true);
  assert(f.store->ClaimJobs("w1", kLeaseMs, 10).empty());

  f.store->SetPaused(false);
  assert(f.store->ClaimJobs("w1", kLeaseMs, 10).size() == 2);

  assert(Throws<sandbox::util::InvalidArgument>([&] { f.store->SetConcurrency(0); }));
  assert(Throws<sandbox::util::InvalidArgument>([&] { f.store->SetConcurrency(21); }));
}

void TestFutureJobsWaitForRunAt() {
  Fixture f;

  EnqueueOptions options;
  options.run_at_ms = f.clock.NowMs() + 5000;
  const auto job    = f.store->Enqueue("t", "{}", options).job;

  assert(f.store->ClaimJobs("w1", kLeaseMs, 1).empty());
  f.store->RunNow(job.id);
  assert(f.store->ClaimJobs("w1", kLeaseMs, 1).size() == 1);
}

void TestFailedAttemptsBackOffThenFail() {
  Fixture f;

  EnqueueOptions options;
  options.dedupe_key = "t:proj1";
  const auto job     = f.store->Enqueue("t", "{}", options).job;

  f.store->ClaimJobs("w1", kLeaseMs, 1);
  auto after_first = f.store->MarkFailedAttempt(job.id, "w1", "boom\n1");
  assert(after_first->state == JobState::kQueued);
  assert(after_first->attempts == 1);
  assert(after_first->run_at_ms == f.clock.NowMs() + 2000);
  assert(after_first->last_error == "boom 1");
  assert(!after_first->locked_at_ms.has_value());

  f.clock.Advance(2000);
  assert(f.store->ClaimJobs("w1", kLeaseMs, 1).size() == 1);
  auto after_second = f.store->MarkFailedAttempt(job.id, "w1", "boom 2");
  assert(after_second->run_at_ms == f.clock.NowMs() + 4000);

  f.clock.Advance(4000);
  assert(f.store->ClaimJobs("w1", kLeaseMs, 1).size() == 1);
  auto after_third = f.store->MarkFailedAttempt(job.id, "w1", "boom 3");
  assert(after_third->state == JobState::kFailed);
  assert(after_third->attempts == 3);
  assert(!after_third->dedupe_active);

  // Dedupe key is free again.
  assert(!f.store->Enqueue("t", "{}", options).deduplicated);
}

void TestRescheduleKeepsAttempts() {
  Fixture f;
  const auto job = f.store->Enqueue("t", "{}").job;

  f.store->ClaimJobs("w1", kLeaseMs, 1);
  f.store->Reschedule(job.id, "w1", 1000);

  const auto stored = f.store->GetJobById(job.id);
  assert(stored->state == JobState::kQueued);
  assert(stored->attempts == 0);
  assert(stored->run_at_ms == f.clock.NowMs() + 1000);
}

void TestLostLeaseIsIgnored() {
  Fixture f;
  const auto job = f.store->Enqueue("t", "{}").job;
  f.store->ClaimJobs("w1", kLeaseMs, 1);

  f.store->MarkSucceeded(job.id, "w2");
  assert(f.store->GetJobById(job.id)->state == JobState::kRunning);
  assert(!f.store->RenewLease(job.id, "w2", kLeaseMs));
  assert(f.store->RenewLease(job.id, "w1", kLeaseMs));
}

void TestCancelSemantics() {
  Fixture f;

  const auto queued = f.store->Enqueue("t", "{}").job;
  const auto result = f.store->Cancel(queued.id);
  assert(result.state == JobState::kCancelled);
  assert(result.cancelled_at_ms.has_value());

  const auto running = f.store->Enqueue("t", "{}").job;
  f.store->ClaimJobs("w1", kLeaseMs, 1);
  const auto requested = f.store->Cancel(running.id);
  assert(requested.state == JobState::kRunning);
  assert(f.store->IsCancelRequested(running.id));

  f.store->MarkCancelled(running.id, "w1");
  assert(f.store->GetJobById(running.id)->state == JobState::kCancelled);

  assert(Throws<sandbox::util::InvalidState>([&] { f.store->Cancel(running.id); }));
  assert(Throws<sandbox::util::NotFound>([&] { f.store->Cancel("missing"); }));
}

void TestForceUnlockOnlyAfterLeaseExpiry() {
  Fixture f;

  const auto job = f.store->Enqueue("t", "{}").job;
  assert(Throws<sandbox::util::InvalidState>([&] { f.store->ForceUnlock(job.id); }));

  f.store->ClaimJobs("w1", kLeaseMs, 1);
  assert(Throws<sandbox::util::InvalidState>([&] { f.store->ForceUnlock(job.id); }));
  assert(f.store->GetJobById(job.id)->state == JobState::kRunning);

  f.clock.Advance(kLeaseMs + 1);
  const auto unlocked = f.store->ForceUnlock(job.id);
  assert(unlocked.state == JobState::kQueued);
  assert(unlocked.locked_by.empty());
  assert(!unlocked.lock_expires_at_ms.has_value());

  // The old owner can no longer complete it.
  f.store->MarkSucceeded(job.id, "w1");
  assert(f.store->GetJobById(job.id)->state == JobState::kQueued);
}

void TestRetryCreatesFreshJob() {
  Fixture f;

  EnqueueOptions options;
  options.project_id = "proj1";
  options.priority   = 7;
  const auto job     = f.store->Enqueue("t", R"({"x":1})", options).job;
  assert(Throws<sandbox::util::InvalidState>([&] { f.store->Retry(job.id); }));

  f.store->Cancel(job.id);
  const auto retried = f.store->Retry(job.id);
  assert(retried.id != job.id);
  assert(retried.state == JobState::kQueued);
  assert(retried.type == "t");
  assert(retried.payload_json == R"({"x":1})");
  assert(retried.project_id == "proj1");
  assert(retried.priority == 7);
  assert(retried.attempts == 0);
}

void TestDeleteRules() {
  Fixture f;

  const auto queued = f.store->Enqueue("t", "{}").job;
  assert(Throws<sandbox::util::InvalidState>([&] { f.store->DeleteJob(queued.id); }));

  f.store->Cancel(queued.id);
  f.store->DeleteJob(queued.id);
  assert(!f.store->GetJobById(queued.id).has_value());

  for (int i = 0; i < 3; ++i) {
    f.store->Cancel(f.store->Enqueue("t", "{}").job.id);
  }
  f.store->Enqueue("t", "{}");

  assert(Throws<sandbox::util::InvalidArgument>([&] { f.store->DeleteJobsByState(JobState::kQueued); }));
  assert(f.store->DeleteJobsByState(JobState::kCancelled) == 3);
  assert(f.store->CountJobs({}) == 1);
}

void TestListFiltersAndOrder() {
  Fixture f;

  EnqueueOptions a;
  a.project_id = "a";
  EnqueueOptions b;
  b.project_id = "b";

  const auto first = f.store->Enqueue("docker.composeUp", "{}", a).job;
  f.clock.Advance(10);
  f.store->Enqueue("production.build", "{}", b);
  f.clock.Advance(10);
  const auto last = f.store->Enqueue("docker.composeUp", R"({"reason":"needle"})", b).job;

  const auto all = f.store->ListJobs({});
  assert(all.size() == 3);
  assert(all.front().id == last.id);
  assert(all.back().id == first.id);

  sandbox::db::JobFilter by_type;
  by_type.type = "docker.composeUp";
  assert(f.store->CountJobs(by_type) == 2);

  sandbox::db::JobFilter by_project;
  by_project.project_id = "b";
  assert(f.store->ListJobs(by_project).size() == 2);

  sandbox::db::JobFilter by_text;
  by_text.text = "needle";
  const auto found = f.store->ListJobs(by_text);
  assert(found.size() == 1 && found[0].id == last.id);

  sandbox::db::Pagination page;
  page.limit  = 1;
  page.offset = 1;
  const auto paged = f.store->ListJobs({}, page);
  assert(paged.size() == 1);
  assert(paged[0].type == "production.build");
}

} // namespace

int main() {
  TestBackoffAndSanitize();
  TestStopDedupesOnProjectKey();
  TestConcurrentEnqueuesShareOneJob();
  TestStopCancelsPendingStart();
  TestClaimOrderAndPerProjectExclusivity();
  TestConcurrencyLimitAndPause();
  TestFutureJobsWaitForRunAt();
  TestFailedAttemptsBackOffThenFail();
  TestRescheduleKeepsAttempts();
  TestLostLeaseIsIgnored();
  TestCancelSemantics();
  TestForceUnlockOnlyAfterLeaseExpiry();
  TestRetryCreatesFreshJob();
  TestDeleteRules();
  TestListFiltersAndOrder();

  std::cout << "sandbox_unit_job_store: pass\n";
  return 0;
}
