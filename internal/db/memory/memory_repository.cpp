#include "memory_repository.hpp"

#include <algorithm>
#include <cctype>
#include <unordered_set>

#include "memory_tx.hpp"

namespace sandbox::db::memory {

using sandbox::model::JobState;

namespace {

std::string Lower(std::string_view value) {
  std::string out(value);
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return out;
}

bool Matches(const model::JobRecord& job, const JobFilter& filter) {
  if (filter.state && job.state != *filter.state) return false;
  if (!filter.type.empty() && job.type != filter.type) return false;
  if (!filter.project_id.empty() && job.project_id != filter.project_id) return false;
  if (!filter.text.empty()) {
    const auto needle = Lower(filter.text);
    if (Lower(job.payload_json).find(needle) == std::string::npos && Lower(job.last_error).find(needle) == std::string::npos) {
      return false;
    }
  }
  return true;
}

} // namespace

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

// ------------------------------------------------------------------
// Jobs
// ------------------------------------------------------------------

Result MemoryRepository::InsertJob(Transaction& t, const model::JobRecord& r) {
  auto& s = TX(t).Mutable();
  if (s.jobs.contains(r.id)) return Result::Err(ErrorCode::AlreadyExists, "job exists: " + r.id);
  if (r.dedupe_active && !r.dedupe_key.empty()) {
    for (const auto& [_, job] : s.jobs) {
      if (job.dedupe_active && job.dedupe_key == r.dedupe_key) {
        return Result::Err(ErrorCode::ConstraintViolation, "dedupe slot held: " + r.dedupe_key);
      }
    }
  }
  s.jobs[r.id] = r;
  return Result::Ok();
}

std::optional<model::JobRecord> MemoryRepository::GetJob(Transaction& t, const std::string& id) {
  const auto& s  = TX(t).View();
  auto        it = s.jobs.find(id);
  if (it == s.jobs.end()) return std::nullopt;
  return it->second;
}

std::optional<model::JobRecord> MemoryRepository::FindActiveJobByDedupeKey(Transaction& t, const std::string& dedupe_key) {
  for (const auto& [_, job] : TX(t).View().jobs) {
    if (job.dedupe_active && job.dedupe_key == dedupe_key) return job;
  }
  return std::nullopt;
}

std::vector<model::JobRecord> MemoryRepository::ListJobs(Transaction& t, const JobFilter& filter, const Pagination& page) {
  std::vector<model::JobRecord> matched;
  for (const auto& [_, job] : TX(t).View().jobs) {
    if (Matches(job, filter)) matched.push_back(job);
  }
  std::sort(matched.begin(), matched.end(), [](const auto& a, const auto& b) {
    if (a.created_at_ms != b.created_at_ms) return a.created_at_ms > b.created_at_ms;
    return a.id > b.id;
  });

  if (page.offset >= matched.size()) return {};
  auto first = matched.begin() + static_cast<std::ptrdiff_t>(page.offset);
  auto last  = matched.end();
  if (page.limit > 0 && page.limit < static_cast<std::size_t>(last - first)) {
    last = first + static_cast<std::ptrdiff_t>(page.limit);
  }
  return {first, last};
}

uint64_t MemoryRepository::CountJobs(Transaction& t, const JobFilter& filter) {
  const auto& jobs = TX(t).View().jobs;
  return static_cast<uint64_t>(std::count_if(jobs.begin(), jobs.end(), [&](const auto& entry) { return Matches(entry.second, filter); }));
}

std::vector<model::JobRecord> MemoryRepository::ListRunnableJobs(Transaction& t, uint64_t now_ms, std::size_t limit) {
  const auto& jobs = TX(t).View().jobs;

  std::unordered_set<std::string> busy_projects;
  for (const auto& [_, job] : jobs) {
    if (job.state == JobState::kRunning && !job.project_id.empty()) busy_projects.insert(job.project_id);
  }

  std::vector<model::JobRecord> runnable;
  for (const auto& [_, job] : jobs) {
    if (job.state != JobState::kQueued || job.run_at_ms > now_ms) continue;
    if (job.lock_expires_at_ms && *job.lock_expires_at_ms >= now_ms) continue;
    if (!job.project_id.empty() && busy_projects.contains(job.project_id)) continue;
    runnable.push_back(job);
  }

  std::sort(runnable.begin(), runnable.end(), [](const auto& a, const auto& b) {
    if (a.priority != b.priority) return a.priority > b.priority;
    if (a.run_at_ms != b.run_at_ms) return a.run_at_ms < b.run_at_ms;
    return a.created_at_ms < b.created_at_ms;
  });
  if (runnable.size() > limit) runnable.resize(limit);
  return runnable;
}

Result MemoryRepository::UpdateJobIf(Transaction& t, const model::JobRecord& r, JobState expected_state, const std::string& expected_locked_by) {
  auto& s  = TX(t).Mutable();
  auto  it = s.jobs.find(r.id);
  if (it == s.jobs.end()) return Result::Err(ErrorCode::NotFound, "job not found: " + r.id);
  if (it->second.state != expected_state) return Result::Err(ErrorCode::Conflict, "job state changed: " + r.id);
  if (!expected_locked_by.empty() && it->second.locked_by != expected_locked_by) {
    return Result::Err(ErrorCode::Conflict, "job lock owner changed: " + r.id);
  }
  it->second = r;
  return Result::Ok();
}

Result MemoryRepository::DeleteJob(Transaction& t, const std::string& id) {
  auto& s  = TX(t).Mutable();
  auto  it = s.jobs.find(id);
  if (it == s.jobs.end()) return Result::Err(ErrorCode::NotFound, "job not found: " + id);
  if (!sandbox::model::IsTerminal(it->second.state)) return Result::Err(ErrorCode::Conflict, "job is not terminal: " + id);
  s.jobs.erase(it);
  return Result::Ok();
}

uint64_t MemoryRepository::DeleteJobsInState(Transaction& t, JobState state) {
  return static_cast<uint64_t>(std::erase_if(TX(t).Mutable().jobs, [&](const auto& entry) { return entry.second.state == state; }));
}

// ------------------------------------------------------------------
// Queue settings
// ------------------------------------------------------------------

std::optional<model::QueueSettingsRecord> MemoryRepository::GetQueueSettings(Transaction& t) {
  return TX(t).View().settings;
}

Result MemoryRepository::SaveQueueSettings(Transaction& t, const model::QueueSettingsRecord& r) {
  TX(t).Mutable().settings = r;
  return Result::Ok();
}

// ------------------------------------------------------------------
// Ports
// ------------------------------------------------------------------

Result MemoryRepository::InsertPort(Transaction& t, const model::PortRecord& r) {
  auto& s = TX(t).Mutable();
  if (s.ports.contains(r.port)) return Result::Err(ErrorCode::AlreadyExists, "port registered: " + std::to_string(r.port));
  s.ports[r.port] = r;
  return Result::Ok();
}

std::optional<model::PortRecord> MemoryRepository::GetPort(Transaction& t, uint32_t port) {
  const auto& s  = TX(t).View();
  auto        it = s.ports.find(port);
  if (it == s.ports.end()) return std::nullopt;
  return it->second;
}

std::vector<model::PortRecord> MemoryRepository::ListPortsForProject(Transaction& t, const std::string& project_id) {
  std::vector<model::PortRecord> out;
  for (const auto& [_, record] : TX(t).View().ports) {
    if (record.project_id == project_id) out.push_back(record);
  }
  return out;
}

Result MemoryRepository::DeletePort(Transaction& t, uint32_t port) {
  TX(t).Mutable().ports.erase(port);
  return Result::Ok();
}

// ------------------------------------------------------------------
// Projects
// ------------------------------------------------------------------

Result MemoryRepository::InsertProject(Transaction& t, const model::ProjectRecord& r) {
  auto& s = TX(t).Mutable();
  if (s.projects.contains(r.id)) return Result::Err(ErrorCode::AlreadyExists, "project exists: " + r.id);
  s.projects[r.id] = r;
  return Result::Ok();
}

std::optional<model::ProjectRecord> MemoryRepository::GetProject(Transaction& t, const std::string& id) {
  const auto& s  = TX(t).View();
  auto        it = s.projects.find(id);
  if (it == s.projects.end()) return std::nullopt;
  return it->second;
}

std::vector<model::ProjectRecord> MemoryRepository::ListProjects(Transaction& t) {
  const auto&                       s = TX(t).View();
  std::vector<model::ProjectRecord> records;
  records.reserve(s.projects.size());
  for (const auto& [_, record] : s.projects) {
    records.push_back(record);
  }
  std::sort(records.begin(), records.end(), [](const auto& a, const auto& b) { return a.id < b.id; });
  return records;
}

Result MemoryRepository::UpdateProject(Transaction& t, const model::ProjectRecord& r) {
  auto& s  = TX(t).Mutable();
  auto  it = s.projects.find(r.id);
  if (it == s.projects.end()) return Result::Err(ErrorCode::NotFound, "project not found: " + r.id);
  it->second = r;
  return Result::Ok();
}

} // namespace sandbox::db::memory
