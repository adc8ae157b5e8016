#pragma once

#include <cstddef>
#include <string>

namespace sandbox::util {

// Random RFC 4122 version 4 id in canonical 8-4-4-4-12 form; used for jobs and generated project ids.
std::string NewId();

// Lowercase hex token for staging directories and temporary links.
std::string RandomSuffix(std::size_t chars = 8);

} // namespace sandbox::util
