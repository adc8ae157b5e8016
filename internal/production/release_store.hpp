#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace sandbox::production {

struct ReleaseVersion {
  std::string hash;
  bool        is_active = false;
  uint64_t    mtime_ms  = 0;
};

struct CleanupReport {
  std::vector<std::string> removed;
  std::vector<std::string> failed;
};

// Atomic replace of `to` by `from`; throws std::filesystem::filesystem_error.
using RenameFn = std::function<void(const std::filesystem::path& from, const std::filesystem::path& to)>;

/*
  On-disk layout of production releases:

    <root>/<project>/<hash>/     one fully written directory per release
    <root>/<project>/current     symlink to "<hash>" (relative)

  Releases are written to a hidden staging directory and renamed into
  place. `current` is repointed by creating a temporary symlink and
  renaming it over the old one, so it always names a complete release.
*/
class ReleaseStore {
 public:
  explicit ReleaseStore(std::filesystem::path root, RenameFn rename = {});

  std::filesystem::path ProjectDir(const std::string& project_id) const;
  std::filesystem::path ReleaseDir(const std::string& project_id, const std::string& hash) const;
  std::filesystem::path CurrentLink(const std::string& project_id) const;

  bool HasRelease(const std::string& project_id, const std::string& hash) const;

  // Newest first by directory mtime.
  std::vector<ReleaseVersion> ListVersions(const std::string& project_id) const;

  std::optional<std::string> CurrentHash(const std::string& project_id) const;

  /*
    Copies `source_dir` into the release directory for `hash`. An
    existing release with the same hash is kept and its mtime bumped.
  */
  void InstallRelease(const std::string& project_id, const std::string& hash, const std::filesystem::path& source_dir);

  // NotFound when the release directory is missing.
  void PromoteRelease(const std::string& project_id, const std::string& hash);

  // What `current` names, when that differs from `failed_hash`.
  std::optional<std::string> GetPreviousReleaseHash(const std::string& project_id, const std::string& failed_hash) const;

  /*
    Keeps the `keep` newest releases and never the current one.
    Per-directory failures are logged and reported, not thrown.
  */
  CleanupReport Cleanup(const std::string& project_id, std::size_t keep);

  void RemoveRelease(const std::string& project_id, const std::string& hash);

  // Drops every release and the symlink.
  void RemoveAll(const std::string& project_id);

  const std::filesystem::path& Root() const {
    return root_;
  }

 private:
  std::filesystem::path root_;
  RenameFn              rename_;
};

} // namespace sandbox::production
