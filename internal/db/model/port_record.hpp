#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace sandbox::db::model {

enum class PortType : std::uint8_t {
  kBase    = 1,
  kVersion = 2,
  kDev     = 3,
};

inline std::string_view ToString(PortType type) {
  switch (type) {
    case PortType::kBase:
      return "base";
    case PortType::kVersion:
      return "version";
    case PortType::kDev:
      return "dev";
  }
  return "unknown";
}

inline std::optional<PortType> ParsePortType(std::string_view value) {
  if (value == "base") return PortType::kBase;
  if (value == "version") return PortType::kVersion;
  if (value == "dev") return PortType::kDev;
  return std::nullopt;
}

// `port` is unique across the whole table regardless of type.
struct PortRecord {
  uint32_t    port = 0;
  PortType    type = PortType::kBase;
  std::string project_id;
  std::string hash;
  uint64_t    created_at_ms = 0;
  uint64_t    updated_at_ms = 0;
};

} // namespace sandbox::db::model
