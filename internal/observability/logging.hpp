#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace siros::runtime::config {
class RuntimeConfig;
}

namespace siros::observability {

// key=value pair appended to the log line.
struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField BoolField(std::string_view key, bool value);

struct LoggingOptions {
  std::string level;
  std::string pattern;
  bool        include_trace_context = false;
};

// Environment (SIROS_LOG_LEVEL, SIROS_LOG_PATTERN,
// SIROS_LOG_INCLUDE_TRACE_CONTEXT) wins over the config file.
LoggingOptions ResolveLoggingOptions(const siros::runtime::config::RuntimeConfig& config);

void InitializeLogging(const siros::runtime::config::RuntimeConfig& config);
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

} // namespace siros::observability

#define SIROS_LOG_INFO(message, ...) ::siros::observability::LogInfo((message), ##__VA_ARGS__)
#define SIROS_LOG_WARN(message, ...) ::siros::observability::LogWarn((message), ##__VA_ARGS__)
#define SIROS_LOG_ERROR(message, ...) ::siros::observability::LogError((message), ##__VA_ARGS__)
