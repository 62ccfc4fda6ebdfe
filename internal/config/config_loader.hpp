#pragma once

#include <string>

#include "config/config.pb.h"

namespace refiner::config {

/*
  Loads RuntimeConfig from YAML.

  YAML is converted to JSON then parsed into protobuf.
*/
class ConfigLoader {
 public:
  static refiner::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static refiner::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml_text);
};

} // namespace refiner::config
