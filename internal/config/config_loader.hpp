#pragma once

#include <string>

#include "config/config.pb.h"

namespace pagewise::config {

/*
  Loads RuntimeConfig from YAML.

  YAML is converted to JSON then parsed into protobuf; unknown keys are
  rejected. Quoted scalars stay strings, so decimals such as
  default_playback_speed must be quoted.
*/
class ConfigLoader {
 public:
  static pagewise::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static pagewise::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml);

  // Fills defaults and checks cross-field constraints. Throws std::runtime_error.
  static void Validate(pagewise::runtime::config::RuntimeConfig& config);
};

} // namespace pagewise::config
