#pragma once

#include <string>

#include "config/config.pb.h"

namespace gate::config {

/*
  Loads RuntimeConfig from YAML.

  YAML is converted to JSON then parsed into protobuf; unknown keys are an
  error. Environment overrides (DATABASE_URL, REDIS_URL, BIND_ADDR) are
  applied on top, then zero values are replaced by defaults.
*/
class ConfigLoader {
 public:
  static gate::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static gate::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& text);

  // No file: defaults plus environment.
  static gate::runtime::config::RuntimeConfig FromEnvironment();

  static void ApplyEnvironmentOverrides(gate::runtime::config::RuntimeConfig& config);
  static void ApplyDefaults(gate::runtime::config::RuntimeConfig& config);
};

} // namespace gate::config
