#pragma once

#include <filesystem>
#include <string>

namespace sandbox::production {

/*
  8 hex characters identifying a build output directory.

  Regular files are visited in byte-wise order of their relative path.
  Each contributes its path, a NUL and its contents to one SHA-256
  digest; the first 8 hex characters are returned. Renaming a file
  changes the hash even when no content does.
*/
std::string ContentHash(const std::filesystem::path& dir);

} // namespace sandbox::production
