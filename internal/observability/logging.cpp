#include "internal/observability/logging.hpp"

#include <cstdlib>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "config/config.pb.h"

#ifdef ENABLE_OTEL
#include <opentelemetry/context/runtime_context.h>
#include <opentelemetry/trace/provider.h>
#include <opentelemetry/trace/span.h>
#endif

namespace sensorlink::observability {
namespace {

std::string ResolveLevel(const sensorlink::runtime::config::LoggingConfig& config) {
  if (const char* level = std::getenv("SENSORLINK_LOG_LEVEL")) {
    return level;
  }

  if (!config.level().empty()) {
    return config.level();
  }

  return "info";
}

std::string ResolvePattern(const sensorlink::runtime::config::LoggingConfig& config) {
  if (const char* pattern = std::getenv("SENSORLINK_LOG_PATTERN")) {
    return pattern;
  }

  if (!config.pattern().empty()) {
    return config.pattern();
  }

  return "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] %v";
}

bool ResolveTraceContextEnabled(const sensorlink::runtime::config::LoggingConfig& config) {
  if (const char* include_trace = std::getenv("SENSORLINK_LOG_INCLUDE_TRACE_CONTEXT")) {
    return std::string(include_trace) == "1" || std::string(include_trace) == "true";
  }
  return config.include_trace_context();
}

constexpr std::uint64_t kDefaultMaxFileBytes = 10 * 1024 * 1024;
constexpr std::uint32_t kDefaultMaxFiles     = 5;

bool g_include_trace_context{false};

bool NeedsQuotes(std::string_view value) {
  return value.empty() || value.find_first_of(" \t\"=") != std::string_view::npos;
}

void AppendValue(std::ostringstream& out, std::string_view value) {
  if (!NeedsQuotes(value)) {
    out << value;
    return;
  }
  out << '"';
  for (char c : value) {
    if (c == '"' || c == '\\') {
      out << '\\';
    }
    out << c;
  }
  out << '"';
}

std::string SerializeFields(std::initializer_list<LogField> fields) {
  std::ostringstream out;
  bool first = true;
  for (const auto& field : fields) {
    if (!first) {
      out << ' ';
    }
    first = false;
    out << field.key << '=';
    AppendValue(out, field.value);
  }
  return out.str();
}

std::vector<spdlog::sink_ptr> BuildSinks(const sensorlink::runtime::config::LoggingConfig& config) {
  std::vector<spdlog::sink_ptr> sinks;
  sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
  if (!config.file_path().empty()) {
    const auto max_bytes = config.max_file_bytes() > 0 ? config.max_file_bytes() : kDefaultMaxFileBytes;
    const auto max_files = config.max_files() > 0 ? config.max_files() : kDefaultMaxFiles;
    sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(config.file_path(), max_bytes, max_files));
  }
  return sinks;
}

#ifdef ENABLE_OTEL
std::string HexId(const uint8_t* data, std::size_t size) {
  static constexpr char kHex[] = "0123456789abcdef";
  std::string result;
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

  auto trace_id = context.trace_id();
  auto span_id  = context.span_id();
  if (trace_id.IsValid() && span_id.IsValid()) {
    uint8_t trace_bytes[16];
    uint8_t span_bytes[8];
    trace_id.CopyBytesTo(trace_bytes);
    span_id.CopyBytesTo(span_bytes);
    return "trace_id=" + HexId(trace_bytes, 16) + " span_id=" + HexId(span_bytes, 8);
  }
  return {};
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

LogField UintField(std::string_view key, std::uint64_t value) {
  return {std::string(key), std::to_string(value)};
}

LogField BoolField(std::string_view key, bool value) {
  return {std::string(key), value ? "true" : "false"};
}

void InitializeLogging(const sensorlink::runtime::config::LoggingConfig& config, std::string_view logger_name) {
  const std::string name(logger_name);
  spdlog::drop(name);

  auto sinks  = BuildSinks(config);
  auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
  logger->set_pattern(ResolvePattern(config));

  // from_str maps unknown names to off
  const auto level_name = ResolveLevel(config);
  auto       level      = spdlog::level::from_str(level_name);
  const bool unknown    = level == spdlog::level::off && level_name != "off";
  logger->set_level(unknown ? spdlog::level::info : level);

  spdlog::register_logger(logger);
  spdlog::set_default_logger(logger);
  spdlog::flush_on(spdlog::level::warn);
  g_include_trace_context = ResolveTraceContextEnabled(config);

  if (unknown) {
    LogWarn("Unknown log level, using info", {StringField("level", level_name)});
  }
}

void ShutdownLogging() {
  spdlog::shutdown();
}

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields) {
  auto serialized_fields = SerializeFields(fields);
  auto trace_fields      = TraceContextFields();

  if (!serialized_fields.empty() && !trace_fields.empty()) {
    spdlog::log(level, "{} {} {}", message, serialized_fields, trace_fields);
    return;
  }
  if (!serialized_fields.empty()) {
    spdlog::log(level, "{} {}", message, serialized_fields);
    return;
  }
  if (!trace_fields.empty()) {
    spdlog::log(level, "{} {}", message, trace_fields);
    return;
  }
  spdlog::log(level, "{}", message);
}

} // namespace sensorlink::observability
