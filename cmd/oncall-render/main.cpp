#include <google/protobuf/util/json_util.h>

#include <algorithm>
#include <cstdint>
#include <iostream>
#include <iterator>
#include <map>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "config/config.pb.h"
#include "internal/config/config_loader.hpp"
#include "internal/io/definition_loader.hpp"
#include "internal/observability/logging.hpp"
#include "internal/render/schedule_renderer.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "oncall/v1.hpp"

using namespace oncall::v1;

static void Usage() {
  std::cerr << "Usage:\n"
            << "  oncall-render --schedule <path> --overrides <path> --from <ISO8601> --until <ISO8601> [--config <config.yaml>]\n";
}

static std::string Indent(const std::string& text, const std::string& prefix) {
  std::istringstream in(text);
  std::ostringstream out;
  std::string        line;
  bool               first = true;
  while (std::getline(in, line)) {
    if (line.empty()) continue;
    if (!first) out << '\n';
    first = false;
    out << prefix << line;
  }
  return out.str();
}

static std::string ToJsonArray(const std::vector<Segment>& segments) {
  if (segments.empty()) {
    return "[]";
  }

  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace                = true;
  options.preserve_proto_field_names    = true;
  options.always_print_primitive_fields = true;

  std::string out = "[\n";
  for (size_t i = 0; i < segments.size(); ++i) {
    std::string json;
    auto        status = google::protobuf::util::MessageToJsonString(segments[i], &json, options);
    if (!status.ok()) {
      throw std::runtime_error("Failed to serialize segment: " + std::string(status.message()));
    }
    out += Indent(json, "  ");
    out += (i + 1 < segments.size()) ? ",\n" : "\n";
  }
  out += "]";
  return out;
}

int main(int argc, char** argv) {
  static const char* kRequired[] = {"--schedule", "--overrides", "--from", "--until"};
  static const char* kKnown[]    = {"--schedule", "--overrides", "--from", "--until", "--config"};

  std::map<std::string, std::string> args;
  for (int i = 1; i < argc; ++i) {
    std::string flag = argv[i];
    if (flag == "--help" || flag == "-h") {
      Usage();
      return 0;
    }

    // Both "--flag value" and "--flag=value".
    std::string value;
    bool        inline_value = false;
    if (const auto eq = flag.find('='); eq != std::string::npos) {
      value        = flag.substr(eq + 1);
      flag         = flag.substr(0, eq);
      inline_value = true;
    }

    if (std::find(std::begin(kKnown), std::end(kKnown), flag) == std::end(kKnown)) {
      std::cerr << "Error: unrecognized argument " << flag << "\n";
      Usage();
      return 1;
    }
    if (!inline_value) {
      if (i + 1 >= argc) {
        std::cerr << "Error: argument " << flag << " expects a value\n";
        Usage();
        return 1;
      }
      value = argv[++i];
    }
    args[flag] = value;
  }
  for (const char* flag : kRequired) {
    if (args.find(flag) == args.end()) {
      std::cerr << "Error: missing required argument " << flag << "\n";
      Usage();
      return 1;
    }
  }

  try {
    // Diagnostics go to stderr so stdout carries only the JSON document.
    oncall::runtime::config::RuntimeConfig config;
    if (args.count("--config")) {
      config = oncall::config::ConfigLoader::LoadFromYaml(args["--config"]);
    }
    oncall::observability::InitializeLogging(config, oncall::observability::LogSink::kStderr, "warn");

    const auto schedule  = oncall::io::DefinitionLoader::LoadSchedule(args["--schedule"]);
    const auto overrides = oncall::io::DefinitionLoader::LoadOverrides(args["--overrides"]);

    const auto from  = oncall::util::ParseTimestamp(args["--from"]);
    const auto until = oncall::util::ParseTimestamp(args["--until"]);

    oncall::render::ScheduleRenderer renderer;
    const auto                       segments = renderer.Render(schedule, overrides, from, until);

    ONCALL_LOG_DEBUG("Rendered schedule",
                     {oncall::observability::StringField("from", oncall::util::FormatTimestamp(from)),
                      oncall::observability::StringField("until", oncall::util::FormatTimestamp(until)),
                      oncall::observability::IntField("overrides", static_cast<std::int64_t>(overrides.size())),
                      oncall::observability::IntField("segments", static_cast<std::int64_t>(segments.size()))});

    std::cout << ToJsonArray(segments) << std::endl;
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 1;
  }

  return 0;
}
