#include "internal/observability/logging.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <cstdlib>
#include <sstream>

#include "config/config.pb.h"
#include "internal/util/errors.hpp"

#ifdef ENABLE_OTEL
#include <opentelemetry/context/runtime_context.h>
#include <opentelemetry/trace/span.h>
#include <opentelemetry/trace/span_context.h>
#endif

namespace refiner::observability {

namespace {

constexpr const char* kLoggerName     = "threat-refiner";
constexpr const char* kDefaultPattern = "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] %v";

bool g_include_trace_context = false;

struct LoggerSettings {
  spdlog::level::level_enum level   = spdlog::level::info;
  std::string               pattern = kDefaultPattern;
  bool                      include_trace_context = false;
};

const char* Env(const char* name) {
  const char* value = std::getenv(name);
  return (value && *value) ? value : nullptr;
}

void Install(const LoggerSettings& settings) {
  spdlog::drop(kLoggerName);
  auto logger = spdlog::stderr_color_mt(kLoggerName);
  logger->set_pattern(settings.pattern);
  logger->set_level(settings.level);
  logger->flush_on(spdlog::level::warn);
  spdlog::set_default_logger(std::move(logger));
  g_include_trace_context = settings.include_trace_context;
}

bool NeedsQuotes(std::string_view value) {
  if (value.empty()) return true;
  return value.find_first_of(" \t\"=") != std::string_view::npos;
}

void AppendValue(std::string& out, std::string_view value) {
  if (!NeedsQuotes(value)) {
    out.append(value);
    return;
  }
  out.push_back('"');
  for (char c : value) {
    if (c == '"' || c == '\\') out.push_back('\\');
    out.push_back(c);
  }
  out.push_back('"');
}

#ifdef ENABLE_OTEL
std::string TraceContext() {
  auto span    = opentelemetry::trace::GetSpan(opentelemetry::context::RuntimeContext::GetCurrent());
  auto context = span->GetContext();
  if (!context.IsValid()) return {};

  char trace_id[32];
  char span_id[16];
  context.trace_id().ToLowerBase16(trace_id);
  context.span_id().ToLowerBase16(span_id);
  return "trace_id=" + std::string(trace_id, sizeof(trace_id)) + " span_id=" + std::string(span_id, sizeof(span_id));
}
#else
std::string TraceContext() {
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

LogField DoubleField(std::string_view key, double value) {
  std::ostringstream out;
  out << value;
  return {std::string(key), out.str()};
}

std::string FormatFields(std::initializer_list<LogField> fields) {
  std::string out;
  for (const auto& field : fields) {
    if (!out.empty()) out.push_back(' ');
    out.append(field.key);
    out.push_back('=');
    AppendValue(out, field.value);
  }
  return out;
}

spdlog::level::level_enum ParseLevel(std::string_view name) {
  const auto level = spdlog::level::from_str(std::string(name));
  // from_str maps every unknown name to off
  if (level == spdlog::level::off && name != "off") {
    throw util::InvalidConfig("unknown log level '" + std::string(name) + "'; use trace, debug, info, warn, error, critical or off");
  }
  return level;
}

void InitializeLogging(const refiner::runtime::config::RuntimeConfig& config) {
  const auto& logging = config.logging();

  LoggerSettings settings;
  if (const char* level = Env("REFINER_LOG_LEVEL")) {
    settings.level = ParseLevel(level);
  } else if (!logging.level().empty()) {
    settings.level = ParseLevel(logging.level());
  }

  if (const char* pattern = Env("REFINER_LOG_PATTERN")) {
    settings.pattern = pattern;
  } else if (!logging.pattern().empty()) {
    settings.pattern = logging.pattern();
  }

  settings.include_trace_context = logging.include_trace_context();
  Install(settings);
}

void InitializeDefaultLogging(std::string_view level) {
  LoggerSettings settings;
  const char*    env_level = Env("REFINER_LOG_LEVEL");
  settings.level           = ParseLevel(env_level ? std::string_view(env_level) : level);
  Install(settings);
}

void ShutdownLogging() {
  spdlog::shutdown();
}

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields) {
  auto* logger = spdlog::default_logger_raw();
  // null once ShutdownLogging has run
  if (!logger || !logger->should_log(level)) return;

  std::string line(message);
  const auto  formatted = FormatFields(fields);
  if (!formatted.empty()) {
    line.push_back(' ');
    line.append(formatted);
  }
  if (g_include_trace_context) {
    const auto trace = TraceContext();
    if (!trace.empty()) {
      line.push_back(' ');
      line.append(trace);
    }
  }

  logger->log(level, line);
}

} // namespace refiner::observability
