#include "definition_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>

#include <filesystem>
#include <fstream>
#include <sstream>

#include "internal/config/config_loader.hpp"
#include "internal/util/errors.hpp"

namespace oncall::io {

using namespace oncall::core::v1;

namespace {

bool IsYamlPath(const std::string& path) {
  const auto extension = std::filesystem::path(path).extension().string();
  return extension == ".yaml" || extension == ".yml";
}

google::protobuf::util::JsonParseOptions DefinitionParseOptions() {
  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = true;
  return options;
}

} // namespace

std::string DefinitionLoader::ReadDocument(const std::string& path) {
  if (IsYamlPath(path)) {
    return oncall::config::ConfigLoader::YamlFileToJson(path);
  }

  std::ifstream in(path);
  if (!in) {
    throw util::NotFound("Could not find file: " + path);
  }

  std::ostringstream buffer;
  buffer << in.rdbuf();
  return buffer.str();
}

Schedule DefinitionLoader::ParseSchedule(const std::string& json) {
  Schedule schedule;
  auto     status = google::protobuf::util::JsonStringToMessage(json, &schedule, DefinitionParseOptions());
  if (!status.ok()) {
    throw util::MalformedInput("Invalid JSON in input file: " + std::string(status.message()));
  }
  return schedule;
}

std::vector<Override> DefinitionLoader::ParseOverrides(const std::string& json) {
  google::protobuf::Value document;
  auto                    status = google::protobuf::util::JsonStringToMessage(json, &document);
  if (!status.ok()) {
    throw util::MalformedInput("Invalid JSON in input file: " + std::string(status.message()));
  }
  if (!document.has_list_value()) {
    throw util::ValidationError("Overrides must be an array");
  }

  OverrideList list;
  status = google::protobuf::util::JsonStringToMessage("{\"overrides\":" + json + "}", &list, DefinitionParseOptions());
  if (!status.ok()) {
    throw util::MalformedInput("Invalid JSON in input file: " + std::string(status.message()));
  }

  return std::vector<Override>(list.overrides().begin(), list.overrides().end());
}

Schedule DefinitionLoader::LoadSchedule(const std::string& path) {
  return ParseSchedule(ReadDocument(path));
}

std::vector<Override> DefinitionLoader::LoadOverrides(const std::string& path) {
  return ParseOverrides(ReadDocument(path));
}

} // namespace oncall::io
