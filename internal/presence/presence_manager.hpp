#pragma once

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>

#include "internal/external/health_probe.hpp"
#include "internal/lock/keyed_mutex.hpp"
#include "internal/projects/project_store.hpp"
#include "internal/queue/job_enqueuer.hpp"

namespace sandbox::runtime::config {
class RuntimeConfig;
}

namespace sandbox::presence {

struct PresenceOptions {
  uint64_t    heartbeat_interval_ms = 15000;
  uint64_t    reaper_interval_ms    = 30000;
  uint64_t    start_max_wait_ms     = 30000;
  uint64_t    grace_period_ms       = 30000;
  uint64_t    idle_timeout_ms       = 60000;
  std::string preview_host          = "localhost";

  static PresenceOptions FromConfig(const sandbox::runtime::config::RuntimeConfig& config);
};

struct HeartbeatResult {
  sandbox::model::ProjectStatus status = sandbox::model::ProjectStatus::kCreated;
  uint32_t                      viewer_count  = 0;
  std::string                   preview_url;
  bool                          preview_ready = false;
  bool                          runtime_ready = false;
  std::string                   message;
  uint64_t                      next_poll_ms = 0;
  // last_error of the project's most recent failed job, if any
  std::string                   setup_error;
};

struct ReaperReport {
  std::size_t scanned        = 0;
  std::size_t pruned_viewers = 0;
  std::size_t stops_enqueued = 0;
  std::size_t dropped        = 0;
};

// Copy of one project's in-memory presence.
struct PresenceSnapshot {
  std::size_t             viewer_count = 0;
  std::optional<uint64_t> stop_at_ms;
  std::optional<uint64_t> started_at_ms;
  bool                    is_starting   = false;
  bool                    stop_enqueued = false;
  uint64_t                last_heartbeat_ms = 0;
};

/*
  PresenceManager

  Tracks viewers per project in memory and reconciles container health
  against the desired state on every heartbeat. The durable project
  status stays the source of truth; after a restart records are rebuilt
  lazily from heartbeats.

  Heartbeats and reaper decisions for one project are serialized by a
  per-project lock; different projects proceed concurrently.
*/
class PresenceManager {
 public:
  PresenceManager(std::shared_ptr<projects::ProjectStore> projects, std::shared_ptr<queue::JobEnqueuer> enqueuer,
                  std::shared_ptr<external::HealthProbe> probe, PresenceOptions options, util::NowFn now = util::Now);
  ~PresenceManager();

  PresenceManager(const PresenceManager&)            = delete;
  PresenceManager& operator=(const PresenceManager&) = delete;

  // NotFound for an unknown project.
  HeartbeatResult HandleHeartbeat(const std::string& project_id, const std::string& viewer_id);

  ReaperReport RunReaperPass();

  // Starts the periodic reaper thread.
  void Start();
  void Stop();

  std::size_t                     TrackedProjects() const;
  std::optional<PresenceSnapshot> Snapshot(const std::string& project_id) const;

  // 500 ms for the first 1.5 s of a start, then 1 s until 6.5 s, then 2 s.
  static uint64_t StartingPollMs(uint64_t elapsed_ms);

 private:
  struct PresenceRecord {
    std::map<std::string, uint64_t> viewers; // viewer id -> last seen
    std::optional<uint64_t>         stop_at_ms;
    std::optional<uint64_t>         started_at_ms;
    bool                            is_starting       = false;
    bool                            stop_enqueued     = false;
    uint64_t                        last_heartbeat_ms = 0;
  };

  std::shared_ptr<PresenceRecord> RecordFor(const std::string& project_id);
  std::shared_ptr<PresenceRecord> FindRecord(const std::string& project_id) const;
  void                            DropRecord(const std::string& project_id);

  // Marks the project starting and enqueues the start job; fills `result`.
  void BeginStart(const projects::ProjectRecord& project, PresenceRecord& record, uint64_t now_ms, const char* message,
                  HeartbeatResult& result);

  std::string LatestSetupError(const std::string& project_id);
  std::string PreviewUrl(const projects::ProjectRecord& project) const;

  // Reaper step for one project; caller holds the project lock.
  void ReapOne(const std::string& project_id, uint64_t now_ms, ReaperReport& report);

  void ReaperLoop();

  std::shared_ptr<projects::ProjectStore> projects_;
  std::shared_ptr<queue::JobEnqueuer>     enqueuer_;
  std::shared_ptr<external::HealthProbe>  probe_;
  PresenceOptions                         options_;
  util::NowFn                             now_;

  mutable lock::KeyedMutex locks_;

  mutable std::mutex                                               records_mutex_;
  std::unordered_map<std::string, std::shared_ptr<PresenceRecord>> records_;

  std::mutex              reaper_mutex_;
  std::condition_variable reaper_wake_;
  std::atomic<bool>       running_{false};
  std::thread             reaper_thread_;
};

} // namespace sandbox::presence
