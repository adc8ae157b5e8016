#include "project_service.hpp"

#include <filesystem>

#include "internal/observability/logging.hpp"
#include "internal/ports/port_allocator.hpp"
#include "internal/projects/project_store.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"
#include "observe_rpc.hpp"
#include "proto_mapping.hpp"

namespace sandbox::service {

using namespace sandbox::orchestrator::v1;

namespace {

constexpr std::size_t kMaxProjectIdLength = 64;

// Ids end up in container and compose project names.
void ValidateProjectId(const std::string& id) {
  if (id.empty() || id.size() > kMaxProjectIdLength) {
    throw util::InvalidArgument("project_id must be 1-64 characters");
  }
  for (const char c : id) {
    const bool ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '-' || c == '_';
    if (!ok) {
      throw util::InvalidArgument("project_id may only contain letters, digits, '-' and '_': " + id);
    }
  }
}

} // namespace

ProjectService::ProjectService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

Project ProjectService::RegisterProject(const RegisterProjectRequest& req) {
  return ObserveRpc("ProjectService.RegisterProject", req.project_id(), [&] {
    if (req.name().empty()) {
      throw util::InvalidArgument("name is required");
    }
    if (req.path_on_disk().empty()) {
      throw util::InvalidArgument("path_on_disk is required");
    }
    const std::filesystem::path path(req.path_on_disk());
    if (!path.is_absolute()) {
      throw util::InvalidArgument("path_on_disk must be absolute: " + req.path_on_disk());
    }

    const std::string id = req.project_id().empty() ? util::NewId() : req.project_id();
    ValidateProjectId(id);
    if (ctx_.projects->Get(id)) {
      throw util::AlreadyExists("project already exists: " + id);
    }

    const auto ports = ctx_.ports->AllocateProjectPorts(id);

    projects::ProjectRecord record;
    record.id           = id;
    record.name         = req.name();
    record.path_on_disk = path.lexically_normal().string();
    record.status       = sandbox::model::ProjectStatus::kCreated;
    record.dev_port     = ports.dev_port;
    record.runtime_port = ports.runtime_port;

    projects::ProjectRecord created;
    try {
      created = ctx_.projects->Create(std::move(record));
    } catch (const std::exception&) {
      ctx_.ports->UnregisterPort(ports.dev_port);
      ctx_.ports->UnregisterPort(ports.runtime_port);
      throw;
    }

    SANDBOX_LOG_INFO("Project registered",
                     {observability::StringField("project_id", created.id), observability::StringField("path", created.path_on_disk),
                      observability::IntField("dev_port", created.dev_port), observability::IntField("runtime_port", created.runtime_port)});
    return ToProto(created);
  });
}

Project ProjectService::GetProject(const GetProjectRequest& req) {
  return ObserveRpc("ProjectService.GetProject", req.project_id(), [&] {
    if (req.project_id().empty()) {
      throw util::InvalidArgument("project_id is required");
    }
    return ToProto(ctx_.projects->Require(req.project_id()));
  });
}

} // namespace sandbox::service
