#pragma once

#include <string>

#include "config/config.pb.h"

namespace impact::config {

/*
  Loads RuntimeConfig from YAML.

  YAML is converted to JSON then parsed into protobuf; unknown keys are
  rejected. Quoted scalars are always strings.
*/
class ConfigLoader {
 public:
  static impact::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static impact::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& text);
};

} // namespace impact::config
