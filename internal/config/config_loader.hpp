#pragma once

#include <string>

#include "config/config.pb.h"

namespace backoffice::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf. Unknown fields are
  rejected; missing fields are filled by ApplyDefaults.
*/
class ConfigLoader {
 public:
  static backoffice::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  // Fills every unset field with its default and validates durations.
  // Throws std::runtime_error on an unparsable duration.
  static void ApplyDefaults(backoffice::runtime::config::RuntimeConfig& config);
};

} // namespace backoffice::config
