#include "internal/observability/logging.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "config/config.pb.h"
#include "internal/util/errors.hpp"

#ifdef ENABLE_OTEL
#include <opentelemetry/context/runtime_context.h>
#include <opentelemetry/trace/provider.h>
#include <opentelemetry/trace/span.h>
#endif

namespace offline::observability {
namespace {

constexpr const char* kLoggerName     = "offline-worker";
constexpr const char* kDefaultPattern = "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] %v";

bool g_include_trace_context{false};

// unset and empty variables both defer to the config file
std::optional<std::string> Env(const char* name) {
  const char* value = std::getenv(name);
  if (value == nullptr || *value == '\0') return std::nullopt;
  return std::string(value);
}

std::string Pick(const char* env, const std::string& configured, const char* fallback) {
  if (auto value = Env(env)) return *value;
  return configured.empty() ? fallback : configured;
}

bool NeedsQuoting(std::string_view value) {
  if (value.empty()) return true;
  return std::any_of(value.begin(), value.end(), [](char c) {
    return c == '"' || c == '=' || c == '\\' || std::isspace(static_cast<unsigned char>(c)) || std::iscntrl(static_cast<unsigned char>(c));
  });
}

void AppendValue(std::string* out, std::string_view value) {
  if (!NeedsQuoting(value)) {
    out->append(value);
    return;
  }

  out->push_back('"');
  for (char c : value) {
    switch (c) {
      case '"':
        out->append("\\\"");
        break;
      case '\\':
        out->append("\\\\");
        break;
      case '\n':
        out->append("\\n");
        break;
      case '\r':
        out->append("\\r");
        break;
      case '\t':
        out->append("\\t");
        break;
      default:
        out->push_back(c);
    }
  }
  out->push_back('"');
}

template <typename Fields>
void AppendFields(std::string* out, const Fields& fields) {
  for (const auto& field : fields) {
    if (!out->empty()) out->push_back(' ');
    out->append(field.key);
    out->push_back('=');
    AppendValue(out, field.value);
  }
}

#ifdef ENABLE_OTEL
std::vector<LogField> TraceContextFields() {
  if (!g_include_trace_context) return {};

  auto span = opentelemetry::trace::GetSpan(opentelemetry::context::RuntimeContext::GetCurrent());
  if (!span) return {};

  const auto context = span->GetContext();
  if (!context.IsValid()) return {};

  char trace_hex[32];
  char span_hex[16];
  context.trace_id().ToLowerBase16(trace_hex);
  context.span_id().ToLowerBase16(span_hex);
  return {{"trace_id", std::string(trace_hex, sizeof(trace_hex))}, {"span_id", std::string(span_hex, sizeof(span_hex))}};
}
#else
std::vector<LogField> TraceContextFields() {
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

spdlog::level::level_enum ParseLevel(std::string_view name) {
  std::string lowered(name);
  std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

  // from_str answers "off" for anything it does not know
  const auto level = spdlog::level::from_str(lowered);
  if (level == spdlog::level::off && lowered != "off") {
    throw offline::util::InvalidArgument("unknown log level: " + std::string(name));
  }
  return level;
}

LogSettings ResolveLogSettings(const offline::runtime::config::RuntimeConfig& config) {
  const auto& logging = config.logging();

  LogSettings settings;
  settings.level   = ParseLevel(Pick("OFFLINE_LOG_LEVEL", logging.level(), "info"));
  settings.pattern = Pick("OFFLINE_LOG_PATTERN", logging.pattern(), kDefaultPattern);
  settings.file    = Pick("OFFLINE_LOG_FILE", logging.file(), "");

  if (auto include = Env("OFFLINE_LOG_INCLUDE_TRACE_CONTEXT")) {
    settings.include_trace_context = *include == "1" || *include == "true";
  } else {
    settings.include_trace_context = logging.include_trace_context();
  }
  return settings;
}

std::string FormatFields(std::initializer_list<LogField> fields) {
  std::string out;
  AppendFields(&out, fields);
  return out;
}

void InitializeLogging(const offline::runtime::config::RuntimeConfig& config) {
  const auto settings = ResolveLogSettings(config);

  std::vector<spdlog::sink_ptr> sinks;
  sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
  if (!settings.file.empty()) {
    sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(settings.file, /*truncate=*/false));
  }

  auto logger = std::make_shared<spdlog::logger>(kLoggerName, sinks.begin(), sinks.end());
  logger->set_pattern(settings.pattern);
  logger->set_level(settings.level);
  logger->flush_on(spdlog::level::warn);

  spdlog::drop(kLoggerName);
  spdlog::set_default_logger(std::move(logger));
  g_include_trace_context = settings.include_trace_context;
}

void ShutdownLogging() {
  spdlog::shutdown();
}

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields) {
  if (!spdlog::should_log(level)) return;

  std::string rendered;
  AppendFields(&rendered, fields);
  AppendFields(&rendered, TraceContextFields());

  if (rendered.empty()) {
    spdlog::log(level, "{}", message);
    return;
  }
  spdlog::log(level, "{} {}", message, rendered);
}

} // namespace offline::observability
