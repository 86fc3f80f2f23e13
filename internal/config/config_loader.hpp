#pragma once

#include <string>

#include "config/config.pb.h"

namespace mlmeta::config {

/*
  Loads RuntimeConfig from YAML.

  YAML is converted to JSON then parsed into protobuf; unknown keys are
  rejected. Environment overrides (MLMETA_BIND_ADDRESS, MLMETA_SQLITE_PATH)
  and defaults are applied afterwards.
*/
class ConfigLoader {
 public:
  static mlmeta::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static mlmeta::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml);
};

} // namespace mlmeta::config
