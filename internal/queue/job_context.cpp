#include "job_context.hpp"

namespace sandbox::queue {

JobContext::JobContext(JobRecord job, JobStore& store, util::NowFn now) : job_(std::move(job)), store_(store), now_(std::move(now)) {
}

uint64_t JobContext::NowMs() const {
  return util::NowMillis(now_);
}

void JobContext::ThrowIfCancelRequested() const {
  if (store_.IsCancelRequested(job_.id)) {
    throw JobCancelled(job_.id);
  }
}

void JobContext::Reschedule(uint64_t delay_ms) const {
  throw JobRescheduled(delay_ms);
}

} // namespace sandbox::queue
