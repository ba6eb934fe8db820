#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace offline::runtime::config {
class RuntimeConfig;
}

namespace offline::observability {

struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField BoolField(std::string_view key, bool value);

/*
  Effective logger settings. Each OFFLINE_LOG_* variable, when set and
  non-empty, overrides the matching `logging` config entry:

    OFFLINE_LOG_LEVEL                  level
    OFFLINE_LOG_PATTERN                pattern
    OFFLINE_LOG_FILE                   file
    OFFLINE_LOG_INCLUDE_TRACE_CONTEXT  include_trace_context ("1" / "true")
*/
struct LogSettings {
  spdlog::level::level_enum level = spdlog::level::info;
  std::string               pattern;
  std::string               file;
  bool                      include_trace_context = false;
};

// throws util::InvalidArgument on an unknown level name
LogSettings ResolveLogSettings(const offline::runtime::config::RuntimeConfig& config);

// case-insensitive; "warning" and "error" are accepted. Throws util::InvalidArgument.
spdlog::level::level_enum ParseLevel(std::string_view name);

/*
  key=value pairs separated by spaces. Values that are empty or hold
  whitespace, quotes or '=' are double-quoted with backslash escapes, so a
  URL or an error message stays one field.
*/
std::string FormatFields(std::initializer_list<LogField> fields);

// safe to call again; the previous "offline-worker" logger is replaced
void InitializeLogging(const offline::runtime::config::RuntimeConfig& config);
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

} // namespace offline::observability

#define OFFLINE_LOG_DEBUG(message, ...) ::offline::observability::LogDebug((message), ##__VA_ARGS__)
#define OFFLINE_LOG_INFO(message, ...) ::offline::observability::LogInfo((message), ##__VA_ARGS__)
#define OFFLINE_LOG_WARN(message, ...) ::offline::observability::LogWarn((message), ##__VA_ARGS__)
#define OFFLINE_LOG_ERROR(message, ...) ::offline::observability::LogError((message), ##__VA_ARGS__)
