#pragma once

#include <optional>

#include "internal/db/api/types.hpp"
#include "internal/db/model/job_record.hpp"
#include "internal/db/model/project_record.hpp"
#include "internal/db/model/queue_settings_record.hpp"
#include "internal/production/release_store.hpp"
#include "sandbox/orchestrator/v1/queue_service.pb.h"
#include "sandbox/orchestrator/v1/types.pb.h"

namespace sandbox::service {

namespace v1 = sandbox::orchestrator::v1;

v1::JobState         ToProto(sandbox::model::JobState state);
v1::ProjectStatus    ToProto(sandbox::model::ProjectStatus status);
v1::ProductionStatus ToProto(sandbox::model::ProductionStatus status);

// nullopt for JOB_STATE_UNSPECIFIED.
std::optional<sandbox::model::JobState> FromProto(v1::JobState state);

v1::Job            ToProto(const db::model::JobRecord& job);
v1::Project        ToProto(const db::model::ProjectRecord& project);
v1::QueueSettings  ToProto(const db::model::QueueSettingsRecord& settings);
v1::ReleaseVersion ToProto(const production::ReleaseVersion& version);

db::JobFilter FromProto(const v1::JobFilter& filter);

} // namespace sandbox::service
