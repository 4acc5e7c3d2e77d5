#include "internal/observability/logging.hpp"

#include <cstdlib>
#include <sstream>
#include <string>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "config/config.pb.h"

#ifdef ENABLE_OTEL
#include <opentelemetry/context/runtime_context.h>
#include <opentelemetry/trace/provider.h>
#include <opentelemetry/trace/span.h>
#endif

namespace siros::observability {
namespace {

constexpr const char* kLoggerName     = "siros";
constexpr const char* kDefaultLevel   = "info";
constexpr const char* kDefaultPattern = "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] %v";

bool g_include_trace_context{false};

const char* Env(const char* name) {
  const char* value = std::getenv(name);
  return (value && *value) ? value : nullptr;
}

std::string QuoteIfNeeded(const std::string& value) {
  if (value.find_first_of(" \t\"=") == std::string::npos && !value.empty()) {
    return value;
  }
  std::string out = "\"";
  for (char c : value) {
    if (c == '"' || c == '\\') out.push_back('\\');
    out.push_back(c);
  }
  out.push_back('"');
  return out;
}

std::string SerializeFields(std::initializer_list<LogField> fields) {
  std::ostringstream out;
  bool               first = true;
  for (const auto& field : fields) {
    if (!first) {
      out << ' ';
    }
    first = false;
    out << field.key << '=' << QuoteIfNeeded(field.value);
  }
  return out.str();
}

#ifdef ENABLE_OTEL
std::string HexId(const uint8_t* data, std::size_t size) {
  static constexpr char kHex[] = "0123456789abcdef";
  std::string           result;
  result.reserve(size * 2);
  for (std::size_t i = 0; i < size; ++i) {
    result.push_back(kHex[(data[i] >> 4) & 0x0F]);
    result.push_back(kHex[data[i] & 0x0F]);
  }
  return result;
}

std::string TraceContextFields() {
  if (!g_include_trace_context) {
    return {};
  }

  auto span = opentelemetry::trace::GetSpan(opentelemetry::context::RuntimeContext::GetCurrent());
  if (!span) {
    return {};
  }

  auto context = span->GetContext();
  if (!context.IsValid()) {
    return {};
  }

  uint8_t trace_bytes[16];
  uint8_t span_bytes[8];
  context.trace_id().CopyBytesTo(trace_bytes);
  context.span_id().CopyBytesTo(span_bytes);
  return "trace_id=" + HexId(trace_bytes, 16) + " span_id=" + HexId(span_bytes, 8);
}
#else
std::string TraceContextFields() {
  return {};
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

LoggingOptions ResolveLoggingOptions(const siros::runtime::config::RuntimeConfig& config) {
  LoggingOptions options;

  if (const char* level = Env("SIROS_LOG_LEVEL")) {
    options.level = level;
  } else if (!config.logging().level().empty()) {
    options.level = config.logging().level();
  } else {
    options.level = kDefaultLevel;
  }

  if (const char* pattern = Env("SIROS_LOG_PATTERN")) {
    options.pattern = pattern;
  } else if (!config.logging().pattern().empty()) {
    options.pattern = config.logging().pattern();
  } else {
    options.pattern = kDefaultPattern;
  }

  if (const char* include_trace = Env("SIROS_LOG_INCLUDE_TRACE_CONTEXT")) {
    options.include_trace_context = std::string(include_trace) == "1" || std::string(include_trace) == "true";
  } else {
    options.include_trace_context = config.logging().include_trace_context();
  }

  return options;
}

void InitializeLogging(const siros::runtime::config::RuntimeConfig& config) {
  const auto options = ResolveLoggingOptions(config);

  auto logger = spdlog::get(kLoggerName);
  if (!logger) {
    logger = spdlog::stdout_color_mt(kLoggerName);
  }
  logger->set_pattern(options.pattern);
  logger->set_level(spdlog::level::from_str(options.level));
  spdlog::set_default_logger(std::move(logger));
  spdlog::flush_on(spdlog::level::warn);
  g_include_trace_context = options.include_trace_context;
}

void ShutdownLogging() {
  spdlog::shutdown();
}

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields) {
  auto line         = std::string(message);
  auto serialized   = SerializeFields(fields);
  auto trace_fields = TraceContextFields();

  if (!serialized.empty()) {
    line += ' ';
    line += serialized;
  }
  if (!trace_fields.empty()) {
    line += ' ';
    line += trace_fields;
  }
  spdlog::log(level, "{}", line);
}

} // namespace siros::observability
