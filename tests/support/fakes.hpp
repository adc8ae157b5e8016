#pragma once

#include <atomic>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <memory>
#include <mutex>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/external/container_runtime.hpp"
#include "internal/external/health_probe.hpp"
#include "internal/external/session_client.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace sandbox::testing {

/*
  Shared test doubles. Everything here is thread-safe so the dispatcher
  tests can drive it from worker threads.
*/

// Clock that only moves when the test advances it.
class ManualClock {
 public:
  explicit ManualClock(uint64_t start_ms = 1'700'000'000'000ULL) : now_ms_(std::make_shared<std::atomic<uint64_t>>(start_ms)) {
  }

  util::NowFn Fn() const {
    auto now_ms = now_ms_;
    return [now_ms] { return util::FromUnixMillis(now_ms->load()); };
  }

  uint64_t NowMs() const {
    return now_ms_->load();
  }

  void Advance(uint64_t ms) {
    now_ms_->fetch_add(ms);
  }

  void Set(uint64_t ms) {
    now_ms_->store(ms);
  }

 private:
  std::shared_ptr<std::atomic<uint64_t>> now_ms_;
};

// Scratch directory removed with everything in it on destruction.
class TempDir {
 public:
  explicit TempDir(const std::string& prefix)
      : path_(std::filesystem::temp_directory_path() / (prefix + "_" + util::RandomSuffix(12))) {
    std::filesystem::create_directories(path_);
  }
  ~TempDir() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
  }

  TempDir(const TempDir&)            = delete;
  TempDir& operator=(const TempDir&) = delete;

  const std::filesystem::path& Path() const {
    return path_;
  }

 private:
  std::filesystem::path path_;
};

inline void WriteFile(const std::filesystem::path& path, const std::string& content) {
  std::filesystem::create_directories(path.parent_path());
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  out << content;
}

inline std::string ReadFile(const std::filesystem::path& path) {
  std::ifstream in(path, std::ios::binary);
  return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

/*
  Records every engine call. Builds write `index.html` with the content
  set through SetBuildOutput, so each deploy can produce a distinct hash.
*/
class FakeContainerRuntime final : public external::ContainerRuntime {
 public:
  explicit FakeContainerRuntime(std::filesystem::path work_dir) : work_dir_(std::move(work_dir)) {
  }

  void ComposeUp(const db::model::ProjectRecord& project) override {
    std::lock_guard<std::mutex> lock(mutex_);
    compose_up_calls_.push_back(project.id);
    if (fail_compose_up_) {
      throw std::runtime_error("compose up failed");
    }
  }

  void ComposeDown(const db::model::ProjectRecord& project) override {
    std::lock_guard<std::mutex> lock(mutex_);
    compose_down_calls_.push_back(project.id);
  }

  std::filesystem::path BuildProductionBundle(const db::model::ProjectRecord& project) override {
    std::lock_guard<std::mutex> lock(mutex_);
    ++build_calls_;
    if (fail_build_) {
      throw std::runtime_error("build failed");
    }
    const auto out = work_dir_ / project.id / "dist";
    std::filesystem::remove_all(out);
    WriteFile(out / "index.html", build_output_);
    return out;
  }

  void StartProduction(const external::ProductionContainerSpec& spec) override {
    std::lock_guard<std::mutex> lock(mutex_);
    if (fail_start_hashes_.count(spec.hash) > 0) {
      throw std::runtime_error("container failed to start: " + spec.hash);
    }
    started_.push_back(spec);
    running_hash_ = spec.hash;
    running_port_ = spec.host_port;
  }

  void StopProduction(const std::string&) override {
    std::lock_guard<std::mutex> lock(mutex_);
    ++stop_production_calls_;
    running_hash_.clear();
    running_port_ = 0;
  }

  void RemoveProductionImages(const std::string&) override {
    std::lock_guard<std::mutex> lock(mutex_);
    ++remove_images_calls_;
  }

  // ------------------------------------------------------------------

  void SetBuildOutput(const std::string& content) {
    std::lock_guard<std::mutex> lock(mutex_);
    build_output_ = content;
  }
  void FailBuild(bool fail) {
    std::lock_guard<std::mutex> lock(mutex_);
    fail_build_ = fail;
  }
  void FailComposeUp(bool fail) {
    std::lock_guard<std::mutex> lock(mutex_);
    fail_compose_up_ = fail;
  }
  void FailStartFor(const std::string& hash) {
    std::lock_guard<std::mutex> lock(mutex_);
    fail_start_hashes_.insert(hash);
  }

  std::string RunningHash() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return running_hash_;
  }
  uint32_t RunningPort() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return running_port_;
  }
  std::vector<external::ProductionContainerSpec> Started() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return started_;
  }
  std::size_t ComposeUpCalls() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return compose_up_calls_.size();
  }
  std::size_t ComposeDownCalls() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return compose_down_calls_.size();
  }
  std::size_t BuildCalls() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return build_calls_;
  }
  std::size_t StopProductionCalls() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stop_production_calls_;
  }
  std::size_t RemoveImagesCalls() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return remove_images_calls_;
  }

 private:
  std::filesystem::path work_dir_;

  mutable std::mutex                             mutex_;
  std::string                                    build_output_ = "<html>v1</html>";
  bool                                           fail_build_      = false;
  bool                                           fail_compose_up_ = false;
  std::set<std::string>                          fail_start_hashes_;
  std::vector<std::string>                       compose_up_calls_;
  std::vector<std::string>                       compose_down_calls_;
  std::vector<external::ProductionContainerSpec> started_;
  std::size_t                                    build_calls_           = 0;
  std::size_t                                    stop_production_calls_ = 0;
  std::size_t                                    remove_images_calls_   = 0;
  std::string                                    running_hash_;
  uint32_t                                       running_port_ = 0;
};

class FakeHealthProbe final : public external::HealthProbe {
 public:
  bool PreviewReady(const db::model::ProjectRecord&) override {
    return preview_ready.load();
  }
  bool RuntimeReady(const db::model::ProjectRecord&) override {
    return runtime_ready.load();
  }
  bool ProductionReady(uint32_t) override {
    production_probes.fetch_add(1);
    return production_ready.load();
  }

  void SetPreview(bool preview, bool runtime) {
    preview_ready.store(preview);
    runtime_ready.store(runtime);
  }

  std::atomic<bool>        preview_ready{false};
  std::atomic<bool>        runtime_ready{false};
  std::atomic<bool>        production_ready{false};
  std::atomic<std::size_t> production_probes{0};
};

class FakeSessionClient final : public external::SessionClient {
 public:
  void CreateSession(const db::model::ProjectRecord&) override {
    calls.fetch_add(1);
  }

  std::atomic<std::size_t> calls{0};
};

} // namespace sandbox::testing
