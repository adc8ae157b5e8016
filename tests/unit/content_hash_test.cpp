#include "internal/production/content_hash.hpp"

#include <cassert>
#include <filesystem>
#include <iostream>

#include "internal/util/errors.hpp"
#include "support/fakes.hpp"

namespace {

namespace fs = std::filesystem;

using sandbox::production::ContentHash;
using sandbox::testing::TempDir;
using sandbox::testing::WriteFile;

void TestHashIsSha256Prefix() {
  TempDir dir("content_hash");
  WriteFile(dir.Path() / "dist" / "index.html", "<html>x</html>");
  WriteFile(dir.Path() / "dist" / "assets" / "app.js", "run();");

  // sha256("assets/app.js\0run();index.html\0<html>x</html>")
  assert(ContentHash(dir.Path() / "dist") == "ed6b4e72");
  assert(ContentHash(dir.Path() / "dist") == ContentHash(dir.Path() / "dist"));
}

void TestEmptyDirectoryHashesNothing() {
  TempDir dir("content_hash");
  fs::create_directories(dir.Path() / "dist");
  assert(ContentHash(dir.Path() / "dist") == "e3b0c442");
}

void TestRenamedFileChangesHash() {
  TempDir dir("content_hash");
  WriteFile(dir.Path() / "a" / "index.html", "<html>same</html>");
  WriteFile(dir.Path() / "b" / "renamed.html", "<html>same</html>");
  assert(ContentHash(dir.Path() / "a") != ContentHash(dir.Path() / "b"));
}

void TestContentChangeChangesHash() {
  TempDir dir("content_hash");
  WriteFile(dir.Path() / "a" / "index.html", "<html>one</html>");
  WriteFile(dir.Path() / "b" / "index.html", "<html>two</html>");
  assert(ContentHash(dir.Path() / "a") != ContentHash(dir.Path() / "b"));
}

void TestMissingDirectoryThrows() {
  TempDir dir("content_hash");
  bool    threw = false;
  try {
    ContentHash(dir.Path() / "missing");
  } catch (const sandbox::util::NotFound&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestHashIsSha256Prefix();
  TestEmptyDirectoryHashesNothing();
  TestRenamedFileChangesHash();
  TestContentChangeChangesHash();
  TestMissingDirectoryThrows();
  std::cout << "sandbox_unit_content_hash: pass\n";
  return 0;
}
