#include "presence_manager.hpp"

#include <chrono>
#include <vector>

#include "config/config.pb.h"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"

namespace sandbox::presence {

using observability::BoolField;
using observability::IntField;
using observability::StringField;
using sandbox::model::ProjectStatus;

namespace {

constexpr uint64_t kFastPollMs     = 500;
constexpr uint64_t kMediumPollMs   = 1000;
constexpr uint64_t kSlowPollMs     = 2000;
constexpr uint64_t kPollStepMs     = 500;
constexpr uint64_t kFastPollCount  = 3;
constexpr uint64_t kMediumPollCount = 13;

constexpr const char* kStartFailedMessage = "Failed to start containers. Open terminal for details.";

} // namespace

PresenceOptions PresenceOptions::FromConfig(const sandbox::runtime::config::RuntimeConfig& config) {
  const auto&     p = config.presence();
  PresenceOptions options;
  if (p.heartbeat_interval_ms() > 0) options.heartbeat_interval_ms = p.heartbeat_interval_ms();
  if (p.reaper_interval_ms() > 0) options.reaper_interval_ms = p.reaper_interval_ms();
  if (p.start_max_wait_ms() > 0) options.start_max_wait_ms = p.start_max_wait_ms();
  if (p.grace_period_ms() > 0) options.grace_period_ms = p.grace_period_ms();
  if (p.idle_timeout_ms() > 0) options.idle_timeout_ms = p.idle_timeout_ms();
  if (!p.preview_host().empty()) options.preview_host = p.preview_host();
  return options;
}

PresenceManager::PresenceManager(std::shared_ptr<projects::ProjectStore> projects, std::shared_ptr<queue::JobEnqueuer> enqueuer,
                                 std::shared_ptr<external::HealthProbe> probe, PresenceOptions options, util::NowFn now)
    : projects_(std::move(projects)),
      enqueuer_(std::move(enqueuer)),
      probe_(std::move(probe)),
      options_(std::move(options)),
      now_(std::move(now)) {
}

PresenceManager::~PresenceManager() {
  Stop();
}

uint64_t PresenceManager::StartingPollMs(uint64_t elapsed_ms) {
  const uint64_t polls = elapsed_ms / kPollStepMs;
  if (polls < kFastPollCount) return kFastPollMs;
  if (polls < kMediumPollCount) return kMediumPollMs;
  return kSlowPollMs;
}

// ------------------------------------------------------------------
// Records
// ------------------------------------------------------------------

std::shared_ptr<PresenceManager::PresenceRecord> PresenceManager::RecordFor(const std::string& project_id) {
  std::lock_guard lock(records_mutex_);
  auto&           slot = records_[project_id];
  if (!slot) {
    slot = std::make_shared<PresenceRecord>();
    observability::Metrics::Instance().SetTrackedProjects(records_.size());
  }
  return slot;
}

std::shared_ptr<PresenceManager::PresenceRecord> PresenceManager::FindRecord(const std::string& project_id) const {
  std::lock_guard lock(records_mutex_);
  auto            it = records_.find(project_id);
  return it == records_.end() ? nullptr : it->second;
}

void PresenceManager::DropRecord(const std::string& project_id) {
  std::lock_guard lock(records_mutex_);
  records_.erase(project_id);
  observability::Metrics::Instance().SetTrackedProjects(records_.size());
}

std::size_t PresenceManager::TrackedProjects() const {
  std::lock_guard lock(records_mutex_);
  return records_.size();
}

std::optional<PresenceSnapshot> PresenceManager::Snapshot(const std::string& project_id) const {
  auto guard  = locks_.Acquire(project_id);
  auto record = FindRecord(project_id);
  if (!record) return std::nullopt;

  PresenceSnapshot snapshot;
  snapshot.viewer_count      = record->viewers.size();
  snapshot.stop_at_ms        = record->stop_at_ms;
  snapshot.started_at_ms     = record->started_at_ms;
  snapshot.is_starting       = record->is_starting;
  snapshot.stop_enqueued     = record->stop_enqueued;
  snapshot.last_heartbeat_ms = record->last_heartbeat_ms;
  return snapshot;
}

std::string PresenceManager::PreviewUrl(const projects::ProjectRecord& project) const {
  return "http://" + options_.preview_host + ":" + std::to_string(project.dev_port);
}

std::string PresenceManager::LatestSetupError(const std::string& project_id) {
  db::JobFilter filter;
  filter.project_id = project_id;
  filter.state      = sandbox::model::JobState::kFailed;
  db::Pagination page;
  page.limit = 1;
  try {
    auto failed = enqueuer_->Store().ListJobs(filter, page);
    if (failed.empty()) return {};
    return failed.front().last_error.empty() ? "setup job failed without error details" : failed.front().last_error;
  } catch (const std::exception& e) {
    SANDBOX_LOG_WARN("setup error lookup failed", {StringField("project_id", project_id), StringField("error", e.what())});
    return {};
  }
}

// ------------------------------------------------------------------
// Heartbeat
// ------------------------------------------------------------------

void PresenceManager::BeginStart(const projects::ProjectRecord& project, PresenceRecord& record, uint64_t now_ms, const char* message,
                                 HeartbeatResult& result) {
  record.is_starting   = true;
  record.started_at_ms = now_ms;

  try {
    projects_->SetStatus(project.id, ProjectStatus::kStarting);
    auto job = enqueuer_->EnqueueDockerStart(project.id, "presence");
    SANDBOX_LOG_INFO("presence start enqueued", {StringField("project_id", project.id), StringField("job_id", job.job.id),
                                                 BoolField("deduplicated", job.deduplicated)});
    result.status       = ProjectStatus::kStarting;
    result.message      = message;
    result.next_poll_ms = kFastPollMs;
  } catch (const std::exception& e) {
    SANDBOX_LOG_ERROR("presence start enqueue failed", {StringField("project_id", project.id), StringField("error", e.what())});
    record.is_starting = false;
    record.started_at_ms.reset();
    projects_->SetStatus(project.id, ProjectStatus::kError);
    result.status       = ProjectStatus::kError;
    result.message      = kStartFailedMessage;
    result.next_poll_ms = kSlowPollMs;
  }
}

HeartbeatResult PresenceManager::HandleHeartbeat(const std::string& project_id, const std::string& viewer_id) {
  observability::SpanScope span("PresenceManager.HandleHeartbeat");
  span.SetAttribute("project_id", project_id);

  auto guard   = locks_.Acquire(project_id);
  auto project = projects_->Get(project_id);
  if (!project) {
    throw util::NotFound("project not found: " + project_id);
  }

  auto record = RecordFor(project_id);

  HeartbeatResult result;
  result.status       = project->status;
  result.preview_url  = PreviewUrl(*project);
  result.setup_error  = LatestSetupError(project_id);
  result.next_poll_ms = options_.heartbeat_interval_ms;

  if (project->status == ProjectStatus::kDeleting) {
    result.viewer_count = static_cast<uint32_t>(record->viewers.size());
    result.message      = "Project is being deleted...";
    result.next_poll_ms = kSlowPollMs;
    return result;
  }

  const auto now_ms = util::NowMillis(now_);
  record->viewers[viewer_id] = now_ms;
  record->stop_at_ms.reset();
  record->last_heartbeat_ms = now_ms;
  record->stop_enqueued     = false;
  result.viewer_count       = static_cast<uint32_t>(record->viewers.size());

  result.preview_ready = probe_->PreviewReady(*project);
  result.runtime_ready = probe_->RuntimeReady(*project);

  const auto status = project->status;
  if (result.preview_ready && result.runtime_ready) {
    if (status != ProjectStatus::kRunning) {
      projects_->SetStatus(project_id, ProjectStatus::kRunning);
    }
    result.status       = ProjectStatus::kRunning;
    record->is_starting = false;
    record->started_at_ms.reset();
  } else if (record->is_starting) {
    if (!record->started_at_ms) record->started_at_ms = now_ms;
    const auto elapsed = now_ms >= *record->started_at_ms ? now_ms - *record->started_at_ms : 0;

    if (elapsed > options_.start_max_wait_ms) {
      SANDBOX_LOG_WARN("presence start timed out", {StringField("project_id", project_id), IntField("elapsed_ms", static_cast<int64_t>(elapsed))});
      projects_->SetStatus(project_id, ProjectStatus::kError);
      record->is_starting = false;
      record->started_at_ms.reset();
      result.status       = ProjectStatus::kError;
      result.message      = kStartFailedMessage;
      result.next_poll_ms = kSlowPollMs;
    } else {
      result.status = ProjectStatus::kStarting;
      if (!result.preview_ready && !result.runtime_ready) {
        result.message = "Starting containers...";
      } else if (!result.preview_ready) {
        result.message = "Waiting for preview...";
      } else {
        result.message = "Waiting for runtime...";
      }
      result.next_poll_ms = StartingPollMs(elapsed);
    }
  } else if (status == ProjectStatus::kCreated || status == ProjectStatus::kStopped || status == ProjectStatus::kError ||
             status == ProjectStatus::kStarting) {
    BeginStart(*project, *record, now_ms, "Starting containers...", result);
  } else if (status == ProjectStatus::kRunning && !result.preview_ready && !result.runtime_ready) {
    SANDBOX_LOG_WARN("preview containers down while running", {StringField("project_id", project_id)});
    projects_->SetStatus(project_id, ProjectStatus::kStopped);
    BeginStart(*project, *record, now_ms, "Restarting containers...", result);
  }

  SANDBOX_LOG_DEBUG("heartbeat", {StringField("project_id", project_id), StringField("viewer_id", viewer_id),
                                  StringField("status", sandbox::model::ToString(result.status)),
                                  BoolField("preview_ready", result.preview_ready), BoolField("runtime_ready", result.runtime_ready),
                                  IntField("next_poll_ms", static_cast<int64_t>(result.next_poll_ms))});
  return result;
}

// ------------------------------------------------------------------
// Reaper
// ------------------------------------------------------------------

void PresenceManager::ReapOne(const std::string& project_id, uint64_t now_ms, ReaperReport& report) {
  auto record = FindRecord(project_id);
  if (!record) return;
  ++report.scanned;

  if (record->is_starting) return;

  const uint64_t stale_before = now_ms > 2 * options_.heartbeat_interval_ms ? now_ms - 2 * options_.heartbeat_interval_ms : 0;
  for (auto it = record->viewers.begin(); it != record->viewers.end();) {
    if (it->second < stale_before) {
      SANDBOX_LOG_DEBUG("pruned stale viewer", {StringField("project_id", project_id), StringField("viewer_id", it->first)});
      it = record->viewers.erase(it);
      ++report.pruned_viewers;
    } else {
      ++it;
    }
  }

  if (!record->viewers.empty()) {
    record->stop_at_ms.reset();
    return;
  }

  if (record->stop_enqueued) {
    DropRecord(project_id);
    ++report.dropped;
    return;
  }

  if (!record->stop_at_ms) {
    record->stop_at_ms = now_ms + options_.grace_period_ms;
    SANDBOX_LOG_DEBUG("presence stop scheduled", {StringField("project_id", project_id), IntField("stop_at_ms", *record->stop_at_ms)});
    return;
  }

  if (now_ms < *record->stop_at_ms) return;
  if (now_ms - record->last_heartbeat_ms < options_.idle_timeout_ms) return;

  auto project = projects_->Get(project_id);
  if (!project || (project->status != ProjectStatus::kRunning && project->status != ProjectStatus::kError)) {
    DropRecord(project_id);
    ++report.dropped;
    return;
  }

  try {
    auto job = enqueuer_->EnqueueDockerStop(project_id, "idle");
    record->stop_enqueued = true;
    ++report.stops_enqueued;
    SANDBOX_LOG_INFO("idle project stop enqueued", {StringField("project_id", project_id), StringField("job_id", job.job.id),
                                                    IntField("idle_ms", static_cast<int64_t>(now_ms - record->last_heartbeat_ms))});
  } catch (const std::exception& e) {
    SANDBOX_LOG_ERROR("idle project stop enqueue failed", {StringField("project_id", project_id), StringField("error", e.what())});
  }
}

ReaperReport PresenceManager::RunReaperPass() {
  observability::SpanScope span("PresenceManager.RunReaperPass");

  std::vector<std::string> ids;
  {
    std::lock_guard lock(records_mutex_);
    ids.reserve(records_.size());
    for (const auto& [id, record] : records_) ids.push_back(id);
  }

  ReaperReport report;
  for (const auto& id : ids) {
    auto guard = locks_.Acquire(id);
    try {
      ReapOne(id, util::NowMillis(now_), report);
    } catch (const std::exception& e) {
      SANDBOX_LOG_ERROR("reaper pass failed for project", {StringField("project_id", id), StringField("error", e.what())});
    }
  }

  if (report.stops_enqueued > 0 || report.dropped > 0) {
    SANDBOX_LOG_INFO("reaper pass", {IntField("scanned", static_cast<int64_t>(report.scanned)),
                                     IntField("stops_enqueued", static_cast<int64_t>(report.stops_enqueued)),
                                     IntField("dropped", static_cast<int64_t>(report.dropped))});
  }
  return report;
}

void PresenceManager::Start() {
  if (running_.exchange(true)) return;
  reaper_thread_ = std::thread(&PresenceManager::ReaperLoop, this);
  SANDBOX_LOG_INFO("presence reaper started", {IntField("interval_ms", static_cast<int64_t>(options_.reaper_interval_ms))});
}

void PresenceManager::Stop() {
  if (!running_.exchange(false)) return;
  reaper_wake_.notify_all();
  if (reaper_thread_.joinable()) reaper_thread_.join();
  SANDBOX_LOG_INFO("presence reaper stopped");
}

void PresenceManager::ReaperLoop() {
  const auto interval = std::chrono::milliseconds(options_.reaper_interval_ms);
  while (running_) {
    {
      std::unique_lock lock(reaper_mutex_);
      if (reaper_wake_.wait_for(lock, interval, [this] { return !running_; })) break;
    }
    RunReaperPass();
  }
}

} // namespace sandbox::presence
