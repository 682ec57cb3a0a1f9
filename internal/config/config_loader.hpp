#pragma once

#include <string>

#include "config/config.pb.h"

namespace oncall::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf.
*/
class ConfigLoader {
 public:
  static oncall::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  // YAML document rendered as a JSON string, shared with the definition loader.
  static std::string YamlFileToJson(const std::string& path);
};

} // namespace oncall::config
