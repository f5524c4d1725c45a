#pragma once

#include <string>

#include "config/config.pb.h"

namespace lipsync::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf. Unknown keys are
  rejected so that typos in a deployment file fail loudly.
*/
class ConfigLoader {
 public:
  static lipsync::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static lipsync::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml);
};

} // namespace lipsync::config
