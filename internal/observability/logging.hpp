#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace cloudstrap::runtime::config {
class RuntimeConfig;
}

namespace cloudstrap::observability {

struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField BoolField(std::string_view key, bool value);

// One log line: the message, then `key=value` pairs. Values with spaces,
// quotes, '=' or control characters are quoted and escaped.
std::string FormatRecord(std::string_view message, std::initializer_list<LogField> fields);

void InitializeLogging(const cloudstrap::runtime::config::RuntimeConfig& config);
void ShutdownLogging();

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields = {});

inline void LogInfo(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::info, message, fields);
}

inline void LogWarn(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::warn, message, fields);
}

inline void LogError(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::err, message, fields);
}

} // namespace cloudstrap::observability

#define CLOUDSTRAP_LOG_INFO(message, ...) ::cloudstrap::observability::LogInfo((message), ##__VA_ARGS__)
#define CLOUDSTRAP_LOG_WARN(message, ...) ::cloudstrap::observability::LogWarn((message), ##__VA_ARGS__)
#define CLOUDSTRAP_LOG_ERROR(message, ...) ::cloudstrap::observability::LogError((message), ##__VA_ARGS__)
