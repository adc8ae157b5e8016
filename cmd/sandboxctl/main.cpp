#include <grpcpp/grpcpp.h>
#include <google/protobuf/util/json_util.h>

#include <cstdlib>
#include <iostream>
#include <map>
#include <memory>
#include <optional>
#include <string>

#include "sandbox/orchestrator/v1.hpp"

using namespace sandbox::orchestrator::v1;

static constexpr const char* kAdminTokenMetadata = "x-sandbox-admin-token";

static void Usage() {
  std::cout << "Usage:\n"
            << "  sandboxctl [--admin-token <token>] <addr> <command> [args]\n"
            << "\n"
            << "Jobs:\n"
            << "  jobs [state=..] [type=..] [project=..] [text=..] [limit=..] [offset=..]\n"
            << "  count [state=..] [type=..] [project=..] [text=..]\n"
            << "  job <id>\n"
            << "  watch [state=..] [type=..] [project=..] [text=..] [limit=..] [interval_ms=..]\n"
            << "  settings\n"
            << "\n"
            << "Jobs (admin):\n"
            << "  cancel <id> | retry <id> | run-now <id> | force-unlock <id> | delete <id>\n"
            << "  delete-state <succeeded|failed|cancelled>\n"
            << "  concurrency <1..20>\n"
            << "  pause | resume\n"
            << "\n"
            << "Projects:\n"
            << "  register <name> <path_on_disk> [project_id]   (admin)\n"
            << "  project <project_id>\n"
            << "  heartbeat <project_id> <viewer_id>\n"
            << "\n"
            << "Production:\n"
            << "  deploy <project_id>\n"
            << "  stop-production <project_id>\n"
            << "  rollback <project_id> <hash>\n"
            << "  versions <project_id>\n"
            << "  production-status <project_id>\n"
            << "\n"
            << "The admin token may also be set with SANDBOX_ADMIN_TOKEN.\n";
}

static std::optional<JobState> ParseState(const std::string& value) {
  if (value == "queued") return JOB_STATE_QUEUED;
  if (value == "running") return JOB_STATE_RUNNING;
  if (value == "succeeded") return JOB_STATE_SUCCEEDED;
  if (value == "failed") return JOB_STATE_FAILED;
  if (value == "cancelled") return JOB_STATE_CANCELLED;
  return std::nullopt;
}

// key=value arguments from argv[first..].
static std::map<std::string, std::string> ParseOptions(int argc, char** argv, int first) {
  std::map<std::string, std::string> options;
  for (int i = first; i < argc; ++i) {
    const std::string arg = argv[i];
    const auto        eq  = arg.find('=');
    if (eq == std::string::npos) {
      std::cerr << "expected key=value, got '" << arg << "'\n";
      std::exit(1);
    }
    options[arg.substr(0, eq)] = arg.substr(eq + 1);
  }
  return options;
}

static uint32_t ParseUint(const std::string& value, const char* what) {
  try {
    return static_cast<uint32_t>(std::stoul(value));
  } catch (const std::exception&) {
    std::cerr << "invalid " << what << ": " << value << "\n";
    std::exit(1);
  }
}

static JobFilter MakeFilter(const std::map<std::string, std::string>& options) {
  JobFilter filter;
  for (const auto& [key, value] : options) {
    if (key == "state") {
      auto state = ParseState(value);
      if (!state) {
        std::cerr << "unknown job state: " << value << "\n";
        std::exit(1);
      }
      filter.set_state(*state);
    } else if (key == "type") {
      filter.set_type(value);
    } else if (key == "project") {
      filter.set_project_id(value);
    } else if (key == "text") {
      filter.set_text(value);
    }
  }
  return filter;
}

static void PrintJson(const google::protobuf::Message& message) {
  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace = true;

  std::string json;
  const auto  status = google::protobuf::util::MessageToJsonString(message, &json, options);
  if (!status.ok()) {
    std::cerr << "failed to render response\n";
    return;
  }
  std::cout << json;
  if (json.empty() || json.back() != '\n') {
    std::cout << "\n";
  }
}

static int Fail(const grpc::Status& status) {
  std::cerr << "error (" << status.error_code() << "): " << status.error_message() << "\n";
  return 2;
}

int main(int argc, char** argv) {
  std::string admin_token;
  if (const char* env = std::getenv("SANDBOX_ADMIN_TOKEN")) {
    admin_token = env;
  }

  int first = 1;
  if (argc >= 3 && std::string(argv[1]) == "--admin-token") {
    admin_token = argv[2];
    first       = 3;
  }

  if (argc - first < 2) {
    Usage();
    return 1;
  }

  std::string addr = argv[first];
  std::string cmd  = argv[first + 1];
  const int   arg0 = first + 2;
  const int   nargs = argc - arg0;

  auto channel = grpc::CreateChannel(addr, grpc::InsecureChannelCredentials());

  auto queue_stub      = SandboxQueueService::NewStub(channel);
  auto presence_stub   = SandboxPresenceService::NewStub(channel);
  auto production_stub = SandboxProductionService::NewStub(channel);
  auto project_stub    = SandboxProjectService::NewStub(channel);

  grpc::ClientContext ctx;
  if (!admin_token.empty()) {
    ctx.AddMetadata(kAdminTokenMetadata, admin_token);
  }

  // ------------------------------------------------------------

  if (cmd == "jobs") {
    const auto options = ParseOptions(argc, argv, arg0);

    ListJobsRequest req;
    *req.mutable_filter() = MakeFilter(options);
    if (options.count("limit")) req.set_limit(ParseUint(options.at("limit"), "limit"));
    if (options.count("offset")) req.set_offset(ParseUint(options.at("offset"), "offset"));

    ListJobsResponse resp;
    auto status = queue_stub->ListJobs(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    PrintJson(resp);
    return 0;
  }

  if (cmd == "count") {
    CountJobsRequest req;
    *req.mutable_filter() = MakeFilter(ParseOptions(argc, argv, arg0));

    CountJobsResponse resp;
    auto status = queue_stub->CountJobs(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << resp.count() << "\n";
    return 0;
  }

  if (cmd == "job") {
    if (nargs < 1) return 1;

    GetJobRequest req;
    req.set_id(argv[arg0]);

    Job resp;
    auto status = queue_stub->GetJob(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    PrintJson(resp);
    return 0;
  }

  if (cmd == "watch") {
    const auto options = ParseOptions(argc, argv, arg0);

    WatchJobsRequest req;
    *req.mutable_filter() = MakeFilter(options);
    if (options.count("limit")) req.set_limit(ParseUint(options.at("limit"), "limit"));
    if (options.count("offset")) req.set_offset(ParseUint(options.at("offset"), "offset"));
    if (options.count("interval_ms")) req.set_interval_ms(ParseUint(options.at("interval_ms"), "interval_ms"));

    auto         reader = queue_stub->WatchJobs(&ctx, req);
    JobsSnapshot snapshot;
    while (reader->Read(&snapshot)) {
      PrintJson(snapshot);
      std::cout.flush();
    }
    auto status = reader->Finish();
    if (!status.ok()) return Fail(status);
    return 0;
  }

  if (cmd == "settings") {
    QueueSettings resp;
    auto status = queue_stub->GetSettings(&ctx, GetSettingsRequest{}, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "paused=" << (resp.paused() ? "true" : "false") << " concurrency=" << resp.concurrency() << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "cancel" || cmd == "retry" || cmd == "run-now" || cmd == "force-unlock") {
    if (nargs < 1) return 1;

    JobIdRequest req;
    req.set_id(argv[arg0]);

    Job          resp;
    grpc::Status status;
    if (cmd == "cancel") {
      status = queue_stub->CancelJob(&ctx, req, &resp);
    } else if (cmd == "retry") {
      status = queue_stub->RetryJob(&ctx, req, &resp);
    } else if (cmd == "run-now") {
      status = queue_stub->RunJobNow(&ctx, req, &resp);
    } else {
      status = queue_stub->ForceUnlockJob(&ctx, req, &resp);
    }
    if (!status.ok()) return Fail(status);

    PrintJson(resp);
    return 0;
  }

  if (cmd == "delete") {
    if (nargs < 1) return 1;

    JobIdRequest req;
    req.set_id(argv[arg0]);

    google::protobuf::Empty resp;
    auto status = queue_stub->DeleteJob(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "deleted\n";
    return 0;
  }

  if (cmd == "delete-state") {
    if (nargs < 1) return 1;

    auto state = ParseState(argv[arg0]);
    if (!state) {
      std::cerr << "unknown job state: " << argv[arg0] << "\n";
      return 1;
    }

    DeleteJobsByStateRequest req;
    req.set_state(*state);

    DeleteJobsByStateResponse resp;
    auto status = queue_stub->DeleteJobsByState(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "deleted=" << resp.deleted() << "\n";
    return 0;
  }

  if (cmd == "concurrency") {
    if (nargs < 1) return 1;

    SetConcurrencyRequest req;
    req.set_concurrency(ParseUint(argv[arg0], "concurrency"));

    QueueSettings resp;
    auto status = queue_stub->SetConcurrency(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "concurrency=" << resp.concurrency() << "\n";
    return 0;
  }

  if (cmd == "pause" || cmd == "resume") {
    SetPausedRequest req;
    req.set_paused(cmd == "pause");

    QueueSettings resp;
    auto status = queue_stub->SetPaused(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "paused=" << (resp.paused() ? "true" : "false") << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "register") {
    if (nargs < 2) return 1;

    RegisterProjectRequest req;
    req.set_name(argv[arg0]);
    req.set_path_on_disk(argv[arg0 + 1]);
    if (nargs >= 3) req.set_project_id(argv[arg0 + 2]);

    Project resp;
    auto status = project_stub->RegisterProject(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    PrintJson(resp);
    return 0;
  }

  if (cmd == "project") {
    if (nargs < 1) return 1;

    GetProjectRequest req;
    req.set_project_id(argv[arg0]);

    Project resp;
    auto status = project_stub->GetProject(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    PrintJson(resp);
    return 0;
  }

  if (cmd == "heartbeat") {
    if (nargs < 2) return 1;

    HeartbeatRequest req;
    req.set_project_id(argv[arg0]);
    req.set_viewer_id(argv[arg0 + 1]);

    HeartbeatResponse resp;
    auto status = presence_stub->Heartbeat(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    PrintJson(resp);
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "deploy" || cmd == "stop-production") {
    if (nargs < 1) return 1;

    ProductionJobResponse resp;
    grpc::Status          status;
    if (cmd == "deploy") {
      DeployRequest req;
      req.set_project_id(argv[arg0]);
      status = production_stub->Deploy(&ctx, req, &resp);
    } else {
      StopProductionRequest req;
      req.set_project_id(argv[arg0]);
      status = production_stub->Stop(&ctx, req, &resp);
    }
    if (!status.ok()) return Fail(status);

    PrintJson(resp);
    return 0;
  }

  if (cmd == "rollback") {
    if (nargs < 2) return 1;

    RollbackRequest req;
    req.set_project_id(argv[arg0]);
    req.set_target_hash(argv[arg0 + 1]);

    RollbackResponse resp;
    auto status = production_stub->Rollback(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    PrintJson(resp);
    return 0;
  }

  if (cmd == "versions") {
    if (nargs < 1) return 1;

    ListVersionsRequest req;
    req.set_project_id(argv[arg0]);

    ListVersionsResponse resp;
    auto status = production_stub->ListVersions(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    for (const auto& version : resp.versions()) {
      std::cout << version.hash() << (version.is_active() ? " *" : "") << " mtime_ms=" << version.mtime_ms() << "\n";
    }
    return 0;
  }

  if (cmd == "production-status") {
    if (nargs < 1) return 1;

    GetProductionStatusRequest req;
    req.set_project_id(argv[arg0]);

    ProductionStatusResponse resp;
    auto status = production_stub->GetProductionStatus(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    PrintJson(resp);
    return 0;
  }

  Usage();
  return 1;
}
