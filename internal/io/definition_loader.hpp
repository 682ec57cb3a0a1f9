#pragma once

#include <string>
#include <vector>

#include "oncall/core/v1/schedule.pb.h"

namespace oncall::io {

/*
  Reads schedule and override definitions from disk.

  Files ending in .yaml or .yml go through the same YAML-to-JSON path as the
  runtime config; anything else is parsed as JSON. Unknown fields are
  ignored. Required-field and range checks are left to the renderer.

  Throws util::NotFound, util::MalformedInput or util::ValidationError.
*/
class DefinitionLoader {
 public:
  static oncall::core::v1::Schedule LoadSchedule(const std::string& path);

  // The document's top level must be an array of overrides.
  static std::vector<oncall::core::v1::Override> LoadOverrides(const std::string& path);

  static oncall::core::v1::Schedule              ParseSchedule(const std::string& json);
  static std::vector<oncall::core::v1::Override> ParseOverrides(const std::string& json);

 private:
  static std::string ReadDocument(const std::string& path);
};

} // namespace oncall::io
