#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace sandbox::model {

// ---------------------------------------------------------------------
// Jobs
// ---------------------------------------------------------------------

enum class JobState : std::uint8_t {
  kQueued    = 1,
  kRunning   = 2,
  kSucceeded = 3,
  kFailed    = 4,
  kCancelled = 5,
};

constexpr bool IsTerminal(JobState state) {
  return state == JobState::kSucceeded || state == JobState::kFailed || state == JobState::kCancelled;
}

/*
  Job states only move forward: queued -> running -> terminal, or
  queued -> cancelled. The dispatcher returns a running job to queued for
  a retry or a reschedule, and forceUnlock does the same for a job whose
  lease expired; those are the only backward edges.
*/
constexpr bool CanTransition(JobState from, JobState to) {
  if (IsTerminal(from)) {
    return false;
  }
  switch (from) {
    case JobState::kQueued:
      return to == JobState::kRunning || to == JobState::kCancelled;
    case JobState::kRunning:
      return to != JobState::kRunning;
    default:
      return false;
  }
}

std::string_view        ToString(JobState state);
std::optional<JobState> ParseJobState(std::string_view value);

// ---------------------------------------------------------------------
// Preview containers
// ---------------------------------------------------------------------

enum class ProjectStatus : std::uint8_t {
  kCreated  = 1,
  kStarting = 2,
  kRunning  = 3,
  kStopping = 4,
  kStopped  = 5,
  kError    = 6,
  kDeleting = 7,
};

std::string_view             ToString(ProjectStatus status);
std::optional<ProjectStatus> ParseProjectStatus(std::string_view value);

// ---------------------------------------------------------------------
// Production deployments
// ---------------------------------------------------------------------

enum class ProductionStatus : std::uint8_t {
  kStopped  = 1,
  kQueued   = 2,
  kBuilding = 3,
  kRunning  = 4,
  kFailed   = 5,
};

constexpr bool IsActive(ProductionStatus status) {
  return status == ProductionStatus::kQueued || status == ProductionStatus::kBuilding;
}

constexpr bool CanTransition(ProductionStatus from, ProductionStatus to) {
  switch (from) {
    case ProductionStatus::kStopped:
      return to == ProductionStatus::kQueued;
    case ProductionStatus::kQueued:
      return to == ProductionStatus::kBuilding || to == ProductionStatus::kFailed;
    case ProductionStatus::kBuilding:
      return to == ProductionStatus::kRunning || to == ProductionStatus::kFailed;
    case ProductionStatus::kRunning:
      return to == ProductionStatus::kQueued || to == ProductionStatus::kStopped || to == ProductionStatus::kFailed;
    case ProductionStatus::kFailed:
      return to == ProductionStatus::kQueued;
  }
  return false;
}

std::string_view                ToString(ProductionStatus status);
std::optional<ProductionStatus> ParseProductionStatus(std::string_view value);

} // namespace sandbox::model
