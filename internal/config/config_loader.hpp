#pragma once

#include <string>

#include "config/config.pb.h"
#include "internal/config/driver_config.hpp"

namespace migrate::config {

/*
  Loads DriverConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf. Unknown keys are
  rejected. Defaults are applied and the result validated; any failure
  throws util::ConfigError.
*/
class ConfigLoader {
 public:
  static DriverConfig LoadFromYaml(const std::string& path);
};

} // namespace migrate::config
