#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace oncall::runtime::config {
class RuntimeConfig;
}

namespace oncall::observability {

struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField BoolField(std::string_view key, bool value);

enum class LogSink {
  kStdout,
  kStderr,
};

/*
  Installs the process-wide logger. Level and pattern come from
  ONCALL_LOG_LEVEL / ONCALL_LOG_PATTERN, then from config, then from
  `default_level`.
*/
void InitializeLogging(const oncall::runtime::config::RuntimeConfig& config,
                       LogSink                                       sink          = LogSink::kStdout,
                       std::string_view                              default_level = "info");
void ShutdownLogging();

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields = {});

inline void LogDebug(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::debug, message, fields);
}

inline void LogInfo(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::info, message, fields);
}

inline void LogWarn(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::warn, message, fields);
}

inline void LogError(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::err, message, fields);
}

} // namespace oncall::observability

#define ONCALL_LOG_DEBUG(message, ...) ::oncall::observability::LogDebug((message), ##__VA_ARGS__)
#define ONCALL_LOG_INFO(message, ...) ::oncall::observability::LogInfo((message), ##__VA_ARGS__)
#define ONCALL_LOG_WARN(message, ...) ::oncall::observability::LogWarn((message), ##__VA_ARGS__)
#define ONCALL_LOG_ERROR(message, ...) ::oncall::observability::LogError((message), ##__VA_ARGS__)
