#include "internal/production/release_store.hpp"

#include <cassert>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <system_error>

#include "internal/util/errors.hpp"
#include "support/fakes.hpp"

namespace {

namespace fs = std::filesystem;

using sandbox::production::ReleaseStore;
using sandbox::testing::ReadFile;
using sandbox::testing::TempDir;
using sandbox::testing::WriteFile;

fs::path MakeBuild(const TempDir& dir, const std::string& name, const std::string& html) {
  const auto out = dir.Path() / "builds" / name;
  WriteFile(out / "index.html", html);
  WriteFile(out / "assets" / "app.js", "console.log('" + name + "');");
  return out;
}

// Pins a release's mtime so ordering does not depend on the filesystem clock.
void SetAge(const ReleaseStore& store, const std::string& project, const std::string& hash, int seconds_ago) {
  fs::last_write_time(store.ReleaseDir(project, hash), fs::file_time_type::clock::now() - std::chrono::seconds(seconds_ago));
}

void TestInstallAndPromote() {
  TempDir      dir("release_store");
  ReleaseStore store(dir.Path() / "production");

  assert(!store.CurrentHash("proj1"));
  assert(store.ListVersions("proj1").empty());

  store.InstallRelease("proj1", "aaaa1111", MakeBuild(dir, "one", "<html>one</html>"));
  assert(store.HasRelease("proj1", "aaaa1111"));
  assert(ReadFile(store.ReleaseDir("proj1", "aaaa1111") / "index.html") == "<html>one</html>");
  assert(fs::exists(store.ReleaseDir("proj1", "aaaa1111") / "assets" / "app.js"));

  store.PromoteRelease("proj1", "aaaa1111");
  assert(store.CurrentHash("proj1") == std::string("aaaa1111"));
  assert(fs::read_symlink(store.CurrentLink("proj1")) == fs::path("aaaa1111"));
  assert(ReadFile(store.CurrentLink("proj1") / "index.html") == "<html>one</html>");

  // No staging or temporary link left behind.
  for (const auto& entry : fs::directory_iterator(store.ProjectDir("proj1"))) {
    assert(entry.path().filename().string().front() != '.');
  }
}

void TestReinstallKeepsExistingRelease() {
  TempDir      dir("release_store");
  ReleaseStore store(dir.Path() / "production");

  store.InstallRelease("proj1", "aaaa1111", MakeBuild(dir, "one", "<html>one</html>"));
  store.InstallRelease("proj1", "aaaa1111", MakeBuild(dir, "other", "<html>other</html>"));
  assert(ReadFile(store.ReleaseDir("proj1", "aaaa1111") / "index.html") == "<html>one</html>");
  assert(store.ListVersions("proj1").size() == 1);
}

void TestListVersionsNewestFirst() {
  TempDir      dir("release_store");
  ReleaseStore store(dir.Path() / "production");

  store.InstallRelease("proj1", "aaaa1111", MakeBuild(dir, "one", "1"));
  store.InstallRelease("proj1", "bbbb2222", MakeBuild(dir, "two", "2"));
  store.InstallRelease("proj1", "cccc3333", MakeBuild(dir, "three", "3"));
  SetAge(store, "proj1", "aaaa1111", 300);
  SetAge(store, "proj1", "bbbb2222", 200);
  SetAge(store, "proj1", "cccc3333", 100);
  store.PromoteRelease("proj1", "bbbb2222");

  const auto versions = store.ListVersions("proj1");
  assert(versions.size() == 3);
  assert(versions[0].hash == "cccc3333" && !versions[0].is_active);
  assert(versions[1].hash == "bbbb2222" && versions[1].is_active);
  assert(versions[2].hash == "aaaa1111" && !versions[2].is_active);
  assert(versions[0].mtime_ms > versions[2].mtime_ms);
}

void TestCleanupKeepsNewestAndCurrent() {
  TempDir      dir("release_store");
  ReleaseStore store(dir.Path() / "production");

  const char* hashes[] = {"aaaa1111", "bbbb2222", "cccc3333", "dddd4444"};
  int         age      = 400;
  for (const char* hash : hashes) {
    store.InstallRelease("proj1", hash, MakeBuild(dir, hash, hash));
    SetAge(store, "proj1", hash, age);
    age -= 100;
  }
  // The oldest release is live after a rollback.
  store.PromoteRelease("proj1", "aaaa1111");

  const auto report = store.Cleanup("proj1", 2);
  assert(report.failed.empty());
  assert(report.removed.size() == 1);
  assert(report.removed[0] == "bbbb2222");

  assert(store.HasRelease("proj1", "aaaa1111"));
  assert(!store.HasRelease("proj1", "bbbb2222"));
  assert(store.HasRelease("proj1", "cccc3333"));
  assert(store.HasRelease("proj1", "dddd4444"));

  // Nothing more to do.
  assert(store.Cleanup("proj1", 2).removed.empty());
}

void TestPreviousReleaseHash() {
  TempDir      dir("release_store");
  ReleaseStore store(dir.Path() / "production");

  store.InstallRelease("proj1", "aaaa1111", MakeBuild(dir, "one", "1"));
  store.PromoteRelease("proj1", "aaaa1111");
  store.InstallRelease("proj1", "bbbb2222", MakeBuild(dir, "two", "2"));

  assert(store.GetPreviousReleaseHash("proj1", "bbbb2222") == std::string("aaaa1111"));
  store.PromoteRelease("proj1", "bbbb2222");
  assert(!store.GetPreviousReleaseHash("proj1", "bbbb2222"));
}

void TestFailedRenameLeavesCurrentIntact() {
  TempDir dir("release_store");
  bool    fail_renames = false;
  auto    rename       = [&fail_renames](const fs::path& from, const fs::path& to) {
    if (fail_renames) {
      throw fs::filesystem_error("injected rename failure", from, to, std::make_error_code(std::errc::io_error));
    }
    fs::rename(from, to);
  };
  ReleaseStore store(dir.Path() / "production", rename);

  store.InstallRelease("proj1", "aaaa1111", MakeBuild(dir, "one", "<html>one</html>"));
  store.PromoteRelease("proj1", "aaaa1111");
  store.InstallRelease("proj1", "bbbb2222", MakeBuild(dir, "two", "<html>two</html>"));

  fail_renames = true;
  bool threw   = false;
  try {
    store.PromoteRelease("proj1", "bbbb2222");
  } catch (const fs::filesystem_error&) {
    threw = true;
  }
  assert(threw);
  assert(store.CurrentHash("proj1") == std::string("aaaa1111"));
  assert(ReadFile(store.CurrentLink("proj1") / "index.html") == "<html>one</html>");

  // Failed install leaves no partial release.
  threw = false;
  try {
    store.InstallRelease("proj1", "cccc3333", MakeBuild(dir, "three", "3"));
  } catch (const fs::filesystem_error&) {
    threw = true;
  }
  assert(threw);
  assert(!store.HasRelease("proj1", "cccc3333"));
  for (const auto& entry : fs::directory_iterator(store.ProjectDir("proj1"))) {
    assert(entry.path().filename().string().front() != '.');
  }
}

void TestPromoteMissingReleaseIsNotFound() {
  TempDir      dir("release_store");
  ReleaseStore store(dir.Path() / "production");

  bool threw = false;
  try {
    store.PromoteRelease("proj1", "ffff0000");
  } catch (const sandbox::util::NotFound&) {
    threw = true;
  }
  assert(threw);
}

void TestRejectsPathComponents() {
  TempDir      dir("release_store");
  ReleaseStore store(dir.Path() / "production");

  bool threw = false;
  try {
    store.ReleaseDir("proj1", "../escape");
  } catch (const sandbox::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);
}

void TestRemoveAll() {
  TempDir      dir("release_store");
  ReleaseStore store(dir.Path() / "production");

  store.InstallRelease("proj1", "aaaa1111", MakeBuild(dir, "one", "1"));
  store.PromoteRelease("proj1", "aaaa1111");
  store.RemoveAll("proj1");

  assert(!fs::exists(store.ProjectDir("proj1")));
  assert(!store.CurrentHash("proj1"));
  assert(store.ListVersions("proj1").empty());
}

} // namespace

int main() {
  TestInstallAndPromote();
  TestReinstallKeepsExistingRelease();
  TestListVersionsNewestFirst();
  TestCleanupKeepsNewestAndCurrent();
  TestPreviousReleaseHash();
  TestFailedRenameLeavesCurrentIntact();
  TestPromoteMissingReleaseIsNotFound();
  TestRejectsPathComponents();
  TestRemoveAll();

  std::cout << "sandbox_unit_release_store: pass\n";
  return 0;
}
