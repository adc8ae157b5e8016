#include "state_machine.hpp"

namespace sandbox::model {

std::string_view ToString(JobState state) {
  switch (state) {
    case JobState::kQueued:
      return "queued";
    case JobState::kRunning:
      return "running";
    case JobState::kSucceeded:
      return "succeeded";
    case JobState::kFailed:
      return "failed";
    case JobState::kCancelled:
      return "cancelled";
  }
  return "unknown";
}

std::optional<JobState> ParseJobState(std::string_view value) {
  if (value == "queued") return JobState::kQueued;
  if (value == "running") return JobState::kRunning;
  if (value == "succeeded") return JobState::kSucceeded;
  if (value == "failed") return JobState::kFailed;
  if (value == "cancelled") return JobState::kCancelled;
  return std::nullopt;
}

std::string_view ToString(ProjectStatus status) {
  switch (status) {
    case ProjectStatus::kCreated:
      return "created";
    case ProjectStatus::kStarting:
      return "starting";
    case ProjectStatus::kRunning:
      return "running";
    case ProjectStatus::kStopping:
      return "stopping";
    case ProjectStatus::kStopped:
      return "stopped";
    case ProjectStatus::kError:
      return "error";
    case ProjectStatus::kDeleting:
      return "deleting";
  }
  return "unknown";
}

std::optional<ProjectStatus> ParseProjectStatus(std::string_view value) {
  if (value == "created") return ProjectStatus::kCreated;
  if (value == "starting") return ProjectStatus::kStarting;
  if (value == "running") return ProjectStatus::kRunning;
  if (value == "stopping") return ProjectStatus::kStopping;
  if (value == "stopped") return ProjectStatus::kStopped;
  if (value == "error") return ProjectStatus::kError;
  if (value == "deleting") return ProjectStatus::kDeleting;
  return std::nullopt;
}

std::string_view ToString(ProductionStatus status) {
  switch (status) {
    case ProductionStatus::kStopped:
      return "stopped";
    case ProductionStatus::kQueued:
      return "queued";
    case ProductionStatus::kBuilding:
      return "building";
    case ProductionStatus::kRunning:
      return "running";
    case ProductionStatus::kFailed:
      return "failed";
  }
  return "unknown";
}

std::optional<ProductionStatus> ParseProductionStatus(std::string_view value) {
  if (value == "stopped") return ProductionStatus::kStopped;
  if (value == "queued") return ProductionStatus::kQueued;
  if (value == "building") return ProductionStatus::kBuilding;
  if (value == "running") return ProductionStatus::kRunning;
  if (value == "failed") return ProductionStatus::kFailed;
  return std::nullopt;
}

} // namespace sandbox::model
