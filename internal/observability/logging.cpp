#include "internal/observability/logging.hpp"

#include <cstdlib>
#include <string>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "config/config.pb.h"

#ifdef ENABLE_OTEL
#include <opentelemetry/context/runtime_context.h>
#include <opentelemetry/trace/provider.h>
#include <opentelemetry/trace/span.h>
#endif

namespace cloudstrap::observability {
namespace {

std::string ResolveLevel(const cloudstrap::runtime::config::RuntimeConfig& config) {
  if (const char* level = std::getenv("CLOUDSTRAP_LOG_LEVEL")) {
    return level;
  }

  if (!config.logging().level().empty()) {
    return config.logging().level();
  }

  return "info";
}

std::string ResolvePattern(const cloudstrap::runtime::config::RuntimeConfig& config) {
  if (const char* pattern = std::getenv("CLOUDSTRAP_LOG_PATTERN")) {
    return pattern;
  }

  if (!config.logging().pattern().empty()) {
    return config.logging().pattern();
  }

  return "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] %v";
}

// Values that would break "key=value" splitting are quoted; control characters are escaped.
bool NeedsQuoting(std::string_view value) {
  if (value.empty()) {
    return true;
  }
  return value.find_first_of(" =\"\\\n\r\t") != std::string_view::npos;
}

void AppendValue(std::string& out, std::string_view value) {
  if (!NeedsQuoting(value)) {
    out.append(value);
    return;
  }
  out.push_back('"');
  for (char c : value) {
    switch (c) {
      case '\n':
        out.append("\\n");
        break;
      case '\r':
        out.append("\\r");
        break;
      case '\t':
        out.append("\\t");
        break;
      case '"':
      case '\\':
        out.push_back('\\');
        out.push_back(c);
        break;
      default:
        out.push_back(c);
    }
  }
  out.push_back('"');
}

#ifdef ENABLE_OTEL
bool g_include_trace_context{false};

void AppendTraceContext(std::string& line) {
  if (!g_include_trace_context) {
    return;
  }

  auto span = opentelemetry::trace::GetSpan(opentelemetry::context::RuntimeContext::GetCurrent());
  if (!span) {
    return;
  }

  auto context = span->GetContext();
  if (!context.IsValid()) {
    return;
  }

  char trace_hex[32];
  char span_hex[16];
  context.trace_id().ToLowerBase16(trace_hex);
  context.span_id().ToLowerBase16(span_hex);
  line += " trace_id=" + std::string(trace_hex, sizeof(trace_hex)) + " span_id=" + std::string(span_hex, sizeof(span_hex));
}
#endif

} // namespace

LogField StringField(std::string_view key, std::string_view value) {
  return {std::string(key), std::string(value)};
}

LogField IntField(std::string_view key, std::int64_t value) {
  return {std::string(key), std::to_string(value)};
}

LogField BoolField(std::string_view key, bool value) {
  return {std::string(key), value ? "true" : "false"};
}

std::string FormatRecord(std::string_view message, std::initializer_list<LogField> fields) {
  std::string line;
  for (char c : message) {
    line.push_back(c == '\n' || c == '\r' ? ' ' : c);
  }
  for (const auto& field : fields) {
    line.push_back(' ');
    line.append(field.key);
    line.push_back('=');
    AppendValue(line, field.value);
  }
  return line;
}

void InitializeLogging(const cloudstrap::runtime::config::RuntimeConfig& config) {
  auto logger = spdlog::get("cloudstrap");
  if (!logger) {
    logger = spdlog::stdout_color_mt("cloudstrap");
  }
  logger->set_pattern(ResolvePattern(config));
  logger->set_level(spdlog::level::from_str(ResolveLevel(config)));
  spdlog::set_default_logger(std::move(logger));
  spdlog::flush_on(spdlog::level::warn);
#ifdef ENABLE_OTEL
  g_include_trace_context = config.logging().include_trace_context();
#endif
}

void ShutdownLogging() {
  spdlog::shutdown();
}

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields) {
  auto line = FormatRecord(message, fields);
#ifdef ENABLE_OTEL
  AppendTraceContext(line);
#endif
  spdlog::log(level, "{}", line);
}

} // namespace cloudstrap::observability
