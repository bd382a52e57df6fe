#pragma once

#include <string>

#include "config/config.pb.h"

namespace inkvault::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf, so unknown keys and
  malformed durations are rejected by the protobuf JSON parser.
*/
class ConfigLoader {
 public:
  static inkvault::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  // Fills every unset field with its documented default.
  static void ApplyDefaults(inkvault::runtime::config::RuntimeConfig* config);
};

} // namespace inkvault::config
