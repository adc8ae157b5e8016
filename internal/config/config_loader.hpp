#pragma once

#include <string>

#include "config/config.pb.h"

namespace sandbox::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf. Unknown keys are
  rejected. Values left unset are filled by ApplyDefaults.
*/
class ConfigLoader {
 public:
  static sandbox::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static sandbox::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml);

  static void ApplyDefaults(sandbox::runtime::config::RuntimeConfig* config);

  // Throws std::runtime_error naming the first inconsistent setting.
  static void Validate(const sandbox::runtime::config::RuntimeConfig& config);
};

} // namespace sandbox::config
