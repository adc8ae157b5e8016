#include "process_runner.hpp"

#include <fcntl.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <thread>

#include "internal/observability/logging.hpp"

namespace sandbox::external {

namespace {

using observability::IntField;
using observability::StringField;

constexpr std::size_t                kErrorTail = 400;
constexpr std::chrono::milliseconds kKillGrace{2000};
constexpr std::chrono::milliseconds kWaitStep{10};

void DrainFd(int fd, std::string& out) {
  char buffer[4096];
  while (true) {
    const ssize_t n = ::read(fd, buffer, sizeof(buffer));
    if (n > 0) {
      out.append(buffer, static_cast<std::size_t>(n));
      continue;
    }
    if (n < 0 && errno == EINTR) continue;
    break;
  }
  ::close(fd);
}

void ClosePair(int fds[2]) {
  if (fds[0] >= 0) ::close(fds[0]);
  if (fds[1] >= 0) ::close(fds[1]);
}

std::string Tail(const std::string& text) {
  if (text.size() <= kErrorTail) return text;
  return text.substr(text.size() - kErrorTail);
}

std::string CommandLine(const std::vector<std::string>& argv) {
  std::string line;
  for (const auto& arg : argv) {
    if (!line.empty()) line.push_back(' ');
    line += arg;
  }
  return line;
}

// Polls the child until it exits or the deadline passes; false on timeout.
bool WaitUntil(pid_t pid, int& status, std::chrono::steady_clock::time_point deadline, bool forever) {
  while (true) {
    const pid_t r = ::waitpid(pid, &status, forever ? 0 : WNOHANG);
    if (r == pid) return true;
    if (r < 0) {
      if (errno == EINTR) continue;
      throw std::runtime_error(std::string("waitpid failed: ") + std::strerror(errno));
    }
    if (std::chrono::steady_clock::now() >= deadline) return false;
    std::this_thread::sleep_for(kWaitStep);
  }
}

} // namespace

ProcessResult RunProcess(const ProcessOptions& options) {
  if (options.argv.empty()) {
    throw std::runtime_error("process argv is empty");
  }

  int out_pipe[2] = {-1, -1};
  int err_pipe[2] = {-1, -1};
  if (::pipe2(out_pipe, O_CLOEXEC) != 0) {
    throw std::runtime_error(std::string("pipe failed: ") + std::strerror(errno));
  }
  if (::pipe2(err_pipe, O_CLOEXEC) != 0) {
    ClosePair(out_pipe);
    throw std::runtime_error(std::string("pipe failed: ") + std::strerror(errno));
  }

  std::vector<char*> argv;
  argv.reserve(options.argv.size() + 1);
  for (const auto& arg : options.argv) {
    argv.push_back(const_cast<char*>(arg.c_str()));
  }
  argv.push_back(nullptr);

  const pid_t pid = ::fork();
  if (pid < 0) {
    ClosePair(out_pipe);
    ClosePair(err_pipe);
    throw std::runtime_error(std::string("fork failed: ") + std::strerror(errno));
  }

  if (pid == 0) {
    ::setpgid(0, 0);
    ::dup2(out_pipe[1], STDOUT_FILENO);
    ::dup2(err_pipe[1], STDERR_FILENO);
    const int devnull = ::open("/dev/null", O_RDONLY);
    if (devnull >= 0) ::dup2(devnull, STDIN_FILENO);
    if (!options.working_dir.empty() && ::chdir(options.working_dir.c_str()) != 0) {
      ::_exit(126);
    }
    for (const auto& [key, value] : options.env) {
      ::setenv(key.c_str(), value.c_str(), 1);
    }
    ::execvp(argv[0], argv.data());
    ::_exit(127);
  }

  ::close(out_pipe[1]);
  ::close(err_pipe[1]);

  ProcessResult result;
  std::thread   out_reader(DrainFd, out_pipe[0], std::ref(result.stdout_text));
  std::thread   err_reader(DrainFd, err_pipe[0], std::ref(result.stderr_text));

  int        status  = 0;
  const bool forever = options.timeout.count() <= 0;
  try {
    if (!WaitUntil(pid, status, std::chrono::steady_clock::now() + options.timeout, forever)) {
      result.timed_out = true;
      ::kill(-pid, SIGTERM);
      if (!WaitUntil(pid, status, std::chrono::steady_clock::now() + kKillGrace, false)) {
        ::kill(-pid, SIGKILL);
        WaitUntil(pid, status, {}, true);
      }
    }
  } catch (...) {
    ::kill(-pid, SIGKILL);
    out_reader.join();
    err_reader.join();
    throw;
  }

  // Grandchildren may still hold the pipes open; the group kill above covers timeouts.
  out_reader.join();
  err_reader.join();

  if (WIFEXITED(status)) {
    result.exit_code = WEXITSTATUS(status);
  } else if (WIFSIGNALED(status)) {
    result.signaled  = true;
    result.exit_code = 128 + WTERMSIG(status);
  }

  SANDBOX_LOG_DEBUG("process finished", {StringField("command", CommandLine(options.argv)), IntField("exit_code", result.exit_code),
                                         observability::BoolField("timed_out", result.timed_out)});
  return result;
}

ProcessResult RunProcessChecked(const ProcessOptions& options) {
  auto result = RunProcess(options);
  if (result.Succeeded()) return result;

  std::string message = CommandLine(options.argv);
  if (result.timed_out) {
    message += " timed out after " + std::to_string(options.timeout.count()) + "ms";
  } else {
    message += " exited with " + std::to_string(result.exit_code);
  }
  const auto& output = result.stderr_text.empty() ? result.stdout_text : result.stderr_text;
  if (!output.empty()) {
    message += ": " + Tail(output);
  }
  throw std::runtime_error(message);
}

} // namespace sandbox::external
