#include "docker_cli_runtime.hpp"

#include <sstream>
#include <stdexcept>

#include "config/config.pb.h"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace sandbox::external {

namespace {

using observability::IntField;
using observability::StringField;

constexpr const char* kProjectLabel = "sandbox.project";

// Container and compose project names take the id verbatim.
void ValidateProjectId(const std::string& project_id) {
  if (project_id.empty()) {
    throw util::InvalidArgument("empty project id");
  }
  for (char c : project_id) {
    const bool ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '-' || c == '_';
    if (!ok) {
      throw util::InvalidArgument("project id not usable as a container name: " + project_id);
    }
  }
}

std::vector<std::string> SplitLines(const std::string& text) {
  std::vector<std::string> lines;
  std::istringstream       in(text);
  std::string              line;
  while (std::getline(in, line)) {
    if (!line.empty()) lines.push_back(line);
  }
  return lines;
}

} // namespace

DockerCliOptions DockerCliOptions::FromConfig(const sandbox::runtime::config::RuntimeConfig& config) {
  const auto&      c = config.containers();
  DockerCliOptions options;
  if (!c.docker_binary().empty()) options.docker_binary = c.docker_binary();
  if (!c.compose_file().empty()) options.compose_file = c.compose_file();
  if (c.build_command_size() > 0) options.build_command.assign(c.build_command().begin(), c.build_command().end());
  if (!c.production_image().empty()) options.production_image = c.production_image();
  if (c.container_port() > 0) options.container_port = c.container_port();
  if (c.compose_timeout_ms() > 0) options.compose_timeout = std::chrono::milliseconds(c.compose_timeout_ms());
  if (c.stop_timeout_ms() > 0) options.stop_timeout = std::chrono::milliseconds(c.stop_timeout_ms());

  const auto& p = config.production();
  if (!p.build_output_dir().empty()) options.build_output_dir = p.build_output_dir();
  if (p.build_timeout_ms() > 0) options.build_timeout = std::chrono::milliseconds(p.build_timeout_ms());
  return options;
}

DockerCliRuntime::DockerCliRuntime(DockerCliOptions options) : options_(std::move(options)) {
}

std::string DockerCliRuntime::ComposeProjectName(const std::string& project_id) {
  return "sandbox_" + project_id;
}

std::string DockerCliRuntime::ProductionContainerName(const std::string& project_id) {
  return "sandbox_prod_" + project_id;
}

std::vector<std::string> DockerCliRuntime::ComposeArgs(const db::model::ProjectRecord& project) const {
  return {options_.docker_binary, "compose", "--project-name", ComposeProjectName(project.id), "--ansi", "never", "-f", options_.compose_file};
}

void DockerCliRuntime::ComposeUp(const db::model::ProjectRecord& project) {
  ValidateProjectId(project.id);

  ProcessOptions proc;
  proc.argv = ComposeArgs(project);
  proc.argv.insert(proc.argv.end(), {"up", "-d", "--remove-orphans", "--build"});
  proc.working_dir = project.path_on_disk;
  proc.timeout     = options_.compose_timeout;
  proc.env         = {{"PROJECT_ID", project.id},
                      {"DEV_PORT", std::to_string(project.dev_port)},
                      {"RUNTIME_PORT", std::to_string(project.runtime_port)}};

  SANDBOX_LOG_INFO("compose up", {StringField("project_id", project.id), StringField("path", project.path_on_disk)});
  RunProcessChecked(proc);
}

void DockerCliRuntime::ComposeDown(const db::model::ProjectRecord& project) {
  ValidateProjectId(project.id);

  ProcessOptions proc;
  proc.argv = ComposeArgs(project);
  proc.argv.insert(proc.argv.end(), {"down", "--remove-orphans"});
  proc.working_dir = project.path_on_disk;
  proc.timeout     = options_.stop_timeout;

  SANDBOX_LOG_INFO("compose down", {StringField("project_id", project.id)});
  RunProcessChecked(proc);
}

std::filesystem::path DockerCliRuntime::BuildProductionBundle(const db::model::ProjectRecord& project) {
  if (options_.build_command.empty()) {
    throw util::InvalidArgument("no build command configured");
  }

  ProcessOptions proc;
  proc.argv        = options_.build_command;
  proc.working_dir = project.path_on_disk;
  proc.timeout     = options_.build_timeout;
  RunProcessChecked(proc);

  auto output = std::filesystem::path(project.path_on_disk) / options_.build_output_dir;
  if (!std::filesystem::is_directory(output)) {
    throw std::runtime_error("build produced no output directory: " + output.string());
  }
  return output;
}

void DockerCliRuntime::StartProduction(const ProductionContainerSpec& spec) {
  ValidateProjectId(spec.project_id);
  const auto port  = std::to_string(spec.host_port);
  const auto cport = std::to_string(options_.container_port);

  ProcessOptions proc;
  proc.argv    = {options_.docker_binary,
                  "run",
                  "-d",
                  "--name",
                  ProductionContainerName(spec.project_id),
                  "--restart",
                  "unless-stopped",
                  "--label",
                  std::string(kProjectLabel) + "=" + spec.project_id,
                  "--label",
                  "sandbox.hash=" + spec.hash,
                  "-p",
                  port + ":" + cport,
                  "-v",
                  spec.release_dir.string() + ":/srv/app:ro",
                  "-w",
                  "/srv/app",
                  options_.production_image,
                  "npx",
                  "--yes",
                  "serve",
                  "-s",
                  ".",
                  "-l",
                  cport};
  proc.timeout = options_.compose_timeout;

  SANDBOX_LOG_INFO("starting production container", {StringField("project_id", spec.project_id), StringField("hash", spec.hash),
                                                     IntField("port", spec.host_port)});
  RunProcessChecked(proc);
}

void DockerCliRuntime::StopProduction(const std::string& project_id) {
  ValidateProjectId(project_id);

  ProcessOptions proc;
  proc.argv    = {options_.docker_binary, "rm", "-f", ProductionContainerName(project_id)};
  proc.timeout = options_.stop_timeout;

  auto result = RunProcess(proc);
  if (result.Succeeded()) {
    SANDBOX_LOG_INFO("production container removed", {StringField("project_id", project_id)});
    return;
  }
  if (result.stderr_text.find("No such container") != std::string::npos) {
    return;
  }
  throw std::runtime_error("docker rm failed for " + ProductionContainerName(project_id) + ": " + result.stderr_text);
}

std::vector<std::string> DockerCliRuntime::ListLabelled(const std::string& object, const std::string& project_id) {
  ProcessOptions proc;
  // -a on images would also list intermediate layers
  proc.argv    = {options_.docker_binary, object, "ls", object == "image" ? "-q" : "-aq", "--filter",
                  std::string("label=") + kProjectLabel + "=" + project_id};
  proc.timeout = options_.stop_timeout;
  return SplitLines(RunProcessChecked(proc).stdout_text);
}

void DockerCliRuntime::RemoveProductionImages(const std::string& project_id) {
  ValidateProjectId(project_id);

  for (const auto& object : {std::string("container"), std::string("image")}) {
    const auto ids = ListLabelled(object, project_id);
    if (ids.empty()) continue;

    ProcessOptions proc;
    proc.argv    = {options_.docker_binary, object, "rm", "-f"};
    proc.timeout = options_.stop_timeout;
    proc.argv.insert(proc.argv.end(), ids.begin(), ids.end());
    RunProcessChecked(proc);
    SANDBOX_LOG_INFO("removed production artifacts", {StringField("project_id", project_id), StringField("kind", object),
                                                      IntField("count", static_cast<int64_t>(ids.size()))});
  }
}

} // namespace sandbox::external
