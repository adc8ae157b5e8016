#include "release_store.hpp"

#include <sys/stat.h>

#include <algorithm>
#include <chrono>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace sandbox::production {

namespace fs = std::filesystem;

using observability::IntField;
using observability::StringField;

namespace {

constexpr const char* kCurrentLink   = "current";
constexpr const char* kStagingPrefix = ".staging-";
constexpr const char* kLinkPrefix    = ".current-";

void RequireComponent(const std::string& value, const char* what) {
  if (value.empty() || value == "." || value == ".." || value.find('/') != std::string::npos || value.front() == '.') {
    throw util::InvalidArgument(std::string("invalid ") + what + ": '" + value + "'");
  }
}

uint64_t MtimeMs(const fs::path& p) {
  struct stat st {};
  if (::stat(p.c_str(), &st) != 0) return 0;
  return static_cast<uint64_t>(st.st_mtim.tv_sec) * 1000 + static_cast<uint64_t>(st.st_mtim.tv_nsec) / 1000000;
}

void Touch(const fs::path& p) {
  std::error_code ec;
  fs::last_write_time(p, fs::file_time_type::clock::now(), ec);
}

} // namespace

ReleaseStore::ReleaseStore(fs::path root, RenameFn rename) : root_(std::move(root)), rename_(std::move(rename)) {
  if (!rename_) {
    rename_ = [](const fs::path& from, const fs::path& to) { fs::rename(from, to); };
  }
}

fs::path ReleaseStore::ProjectDir(const std::string& project_id) const {
  RequireComponent(project_id, "project id");
  return root_ / project_id;
}

fs::path ReleaseStore::ReleaseDir(const std::string& project_id, const std::string& hash) const {
  RequireComponent(hash, "release hash");
  return ProjectDir(project_id) / hash;
}

fs::path ReleaseStore::CurrentLink(const std::string& project_id) const {
  return ProjectDir(project_id) / kCurrentLink;
}

bool ReleaseStore::HasRelease(const std::string& project_id, const std::string& hash) const {
  std::error_code ec;
  const auto      dir = ReleaseDir(project_id, hash);
  return !fs::is_symlink(dir, ec) && fs::is_directory(dir, ec);
}

std::vector<ReleaseVersion> ReleaseStore::ListVersions(const std::string& project_id) const {
  std::vector<ReleaseVersion> versions;
  const auto                  dir = ProjectDir(project_id);

  std::error_code ec;
  if (!fs::is_directory(dir, ec)) return versions;

  const auto current = CurrentHash(project_id);
  for (const auto& entry : fs::directory_iterator(dir)) {
    const auto name = entry.path().filename().string();
    if (name.empty() || name.front() == '.' || entry.is_symlink() || !entry.is_directory()) continue;

    ReleaseVersion version;
    version.hash      = name;
    version.is_active = current && *current == name;
    version.mtime_ms  = MtimeMs(entry.path());
    versions.push_back(std::move(version));
  }

  std::sort(versions.begin(), versions.end(), [](const ReleaseVersion& a, const ReleaseVersion& b) {
    if (a.mtime_ms != b.mtime_ms) return a.mtime_ms > b.mtime_ms;
    return a.hash > b.hash;
  });
  return versions;
}

std::optional<std::string> ReleaseStore::CurrentHash(const std::string& project_id) const {
  std::error_code ec;
  const auto      link = CurrentLink(project_id);
  if (!fs::is_symlink(link, ec)) return std::nullopt;

  const auto target = fs::read_symlink(link, ec);
  if (ec) return std::nullopt;
  return target.filename().string();
}

void ReleaseStore::InstallRelease(const std::string& project_id, const std::string& hash, const fs::path& source_dir) {
  const auto target = ReleaseDir(project_id, hash);
  if (HasRelease(project_id, hash)) {
    Touch(target);
    SANDBOX_LOG_INFO("release already installed", {StringField("project_id", project_id), StringField("hash", hash)});
    return;
  }

  const auto project_dir = ProjectDir(project_id);
  fs::create_directories(project_dir);

  const auto staging = project_dir / (std::string(kStagingPrefix) + hash + "-" + util::RandomSuffix());
  try {
    fs::copy(source_dir, staging, fs::copy_options::recursive | fs::copy_options::copy_symlinks);
    rename_(staging, target);
  } catch (const fs::filesystem_error&) {
    std::error_code ec;
    fs::remove_all(staging, ec);
    throw;
  }
  Touch(target);

  SANDBOX_LOG_INFO("release installed", {StringField("project_id", project_id), StringField("hash", hash), StringField("path", target.string())});
}

void ReleaseStore::PromoteRelease(const std::string& project_id, const std::string& hash) {
  if (!HasRelease(project_id, hash)) {
    throw util::NotFound("release not found: " + project_id + "/" + hash);
  }

  const auto link = CurrentLink(project_id);
  const auto temp = ProjectDir(project_id) / (std::string(kLinkPrefix) + util::RandomSuffix());

  fs::create_directory_symlink(hash, temp);
  try {
    rename_(temp, link);
  } catch (const fs::filesystem_error& e) {
    std::error_code ec;
    fs::remove(temp, ec);
    SANDBOX_LOG_ERROR("release promotion failed", {StringField("project_id", project_id), StringField("hash", hash), StringField("error", e.what())});
    throw;
  }

  SANDBOX_LOG_INFO("release promoted", {StringField("project_id", project_id), StringField("hash", hash)});
}

std::optional<std::string> ReleaseStore::GetPreviousReleaseHash(const std::string& project_id, const std::string& failed_hash) const {
  auto current = CurrentHash(project_id);
  if (!current || *current == failed_hash) return std::nullopt;
  return current;
}

CleanupReport ReleaseStore::Cleanup(const std::string& project_id, std::size_t keep) {
  CleanupReport report;

  std::vector<ReleaseVersion> versions;
  try {
    versions = ListVersions(project_id);
  } catch (const fs::filesystem_error& e) {
    SANDBOX_LOG_ERROR("release cleanup failed", {StringField("project_id", project_id), StringField("error", e.what())});
    return report;
  }
  if (versions.size() <= keep) return report;

  const auto current = CurrentHash(project_id);
  for (std::size_t i = keep; i < versions.size(); ++i) {
    const auto& hash = versions[i].hash;
    if (current && *current == hash) continue;

    std::error_code ec;
    fs::remove_all(ReleaseDir(project_id, hash), ec);
    if (ec) {
      SANDBOX_LOG_ERROR("release removal failed", {StringField("project_id", project_id), StringField("hash", hash), StringField("error", ec.message())});
      report.failed.push_back(hash);
      continue;
    }
    SANDBOX_LOG_INFO("old release removed", {StringField("project_id", project_id), StringField("hash", hash)});
    report.removed.push_back(hash);
  }

  SANDBOX_LOG_DEBUG("release cleanup done", {StringField("project_id", project_id), IntField("kept", static_cast<int64_t>(keep)),
                                             IntField("removed", static_cast<int64_t>(report.removed.size()))});
  return report;
}

void ReleaseStore::RemoveRelease(const std::string& project_id, const std::string& hash) {
  fs::remove_all(ReleaseDir(project_id, hash));
}

void ReleaseStore::RemoveAll(const std::string& project_id) {
  const auto removed = fs::remove_all(ProjectDir(project_id));
  SANDBOX_LOG_INFO("releases removed", {StringField("project_id", project_id), IntField("entries", static_cast<int64_t>(removed))});
}

} // namespace sandbox::production
