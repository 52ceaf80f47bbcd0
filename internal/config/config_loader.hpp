#pragma once

#include <string>

#include "config/config.pb.h"

namespace medianode::config {

/*
  Loads RuntimeConfig from YAML.

  YAML is converted to JSON then parsed into protobuf, so unknown keys are
  rejected and durations use the protobuf JSON form ("90s"). Unset values
  are filled with defaults and the result is validated.
*/
class ConfigLoader {
 public:
  static medianode::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static medianode::runtime::config::RuntimeConfig LoadFromString(const std::string& yaml);

  static void ApplyDefaults(medianode::runtime::config::RuntimeConfig& config);

  // Throws std::invalid_argument naming the first offending key.
  static void Validate(const medianode::runtime::config::RuntimeConfig& config);
};

} // namespace medianode::config
