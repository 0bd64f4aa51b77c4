#pragma once

#include <string>

#include "config/config.pb.h"

namespace durable::config {

/*
  Loads RuntimeConfig from YAML.

  YAML is converted to JSON then parsed into protobuf. Unknown fields are
  rejected. Defaults are filled in and the result validated before return.
*/
class ConfigLoader {
 public:
  static durable::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static durable::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml);

  // Fills unset engine/database settings; idempotent.
  static void ApplyDefaults(durable::runtime::config::RuntimeConfig& config);

  // Throws std::runtime_error on an unusable configuration.
  static void Validate(const durable::runtime::config::RuntimeConfig& config);
};

} // namespace durable::config
