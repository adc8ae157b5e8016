#include "presence_service.hpp"

#include "internal/presence/presence_manager.hpp"
#include "internal/util/errors.hpp"
#include "observe_rpc.hpp"

namespace sandbox::service {

using namespace sandbox::orchestrator::v1;

PresenceService::PresenceService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

HeartbeatResponse PresenceService::Heartbeat(const HeartbeatRequest& req) {
  return ObserveRpc("PresenceService.Heartbeat", req.project_id(), [&] {
    if (req.project_id().empty() || req.viewer_id().empty()) {
      throw util::InvalidArgument("project_id and viewer_id are required");
    }

    const auto result = ctx_.presence->HandleHeartbeat(req.project_id(), req.viewer_id());

    HeartbeatResponse resp;
    resp.set_status(std::string(sandbox::model::ToString(result.status)));
    resp.set_viewer_count(result.viewer_count);
    resp.set_preview_url(result.preview_url);
    resp.set_preview_ready(result.preview_ready);
    resp.set_runtime_ready(result.runtime_ready);
    resp.set_message(result.message);
    resp.set_next_poll_ms(static_cast<uint32_t>(result.next_poll_ms));
    resp.set_setup_error(result.setup_error);
    return resp;
  });
}

} // namespace sandbox::service
