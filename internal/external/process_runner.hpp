#pragma once

#include <chrono>
#include <filesystem>
#include <string>
#include <utility>
#include <vector>

namespace sandbox::external {

struct ProcessOptions {
  std::vector<std::string>                         argv;
  std::filesystem::path                            working_dir;
  std::vector<std::pair<std::string, std::string>> env;
  // zero waits forever
  std::chrono::milliseconds                        timeout{0};
};

struct ProcessResult {
  int         exit_code = -1;
  bool        timed_out = false;
  bool        signaled  = false;
  std::string stdout_text;
  std::string stderr_text;

  bool Succeeded() const {
    return !timed_out && !signaled && exit_code == 0;
  }
};

/*
  Runs a child process to completion with captured output.

  The child gets its own process group; on timeout the whole group is
  sent SIGTERM, then SIGKILL after a short grace. Throws
  std::runtime_error only when the process cannot be started.
*/
ProcessResult RunProcess(const ProcessOptions& options);

// RunProcess, throwing std::runtime_error with the output tail on any failure.
ProcessResult RunProcessChecked(const ProcessOptions& options);

} // namespace sandbox::external
