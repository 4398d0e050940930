#pragma once

#include <string>

#include "config/config.pb.h"

namespace eventship::config {

/*
  Loads RuntimeConfig from a YAML file.

  YAML is converted to JSON then parsed into protobuf; unknown keys are
  rejected. Missing optional values get their defaults and the result is
  validated, so callers can use it directly. Throws std::runtime_error.
*/
class ConfigLoader {
 public:
  static eventship::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  static eventship::runtime::config::RuntimeConfig ParseYaml(const std::string& yaml);

  static void ApplyDefaults(eventship::runtime::config::RuntimeConfig* config);
  static void Validate(const eventship::runtime::config::RuntimeConfig& config);
};

} // namespace eventship::config
