#include "internal/observability/logging.hpp"

#include <cstdlib>
#include <string>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "config/config.pb.h"
#include "internal/util/time.hpp"

#ifdef ENABLE_OTEL
#include <opentelemetry/context/runtime_context.h>
#include <opentelemetry/trace/provider.h>
#include <opentelemetry/trace/span.h>
#endif

namespace meshdeploy::observability {
namespace {

constexpr const char* kLoggerName     = "meshdeploy";
constexpr const char* kDefaultPattern = "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] %v";

bool g_include_trace_context{false};

std::string EnvOr(const char* name, const std::string& configured, const char* fallback) {
  if (const char* value = std::getenv(name)) {
    return value;
  }
  return configured.empty() ? std::string(fallback) : configured;
}

bool TraceContextEnabled(const meshdeploy::runtime::config::RuntimeConfig& config) {
  if (const char* value = std::getenv("MESHDEPLOY_LOG_INCLUDE_TRACE_CONTEXT")) {
    const std::string flag(value);
    return flag == "1" || flag == "true";
  }
  return config.logging().include_trace_context();
}

bool NeedsQuoting(std::string_view value) {
  if (value.empty()) return true;
  for (char c : value) {
    if (c == ' ' || c == '\t' || c == '=' || c == '"') return true;
  }
  return false;
}

void AppendValue(std::string& out, std::string_view value) {
  if (!NeedsQuoting(value)) {
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

void AppendFields(std::string& out, std::initializer_list<LogField> fields) {
  for (const auto& field : fields) {
    out.push_back(' ');
    out.append(field.key);
    out.push_back('=');
    AppendValue(out, field.value);
  }
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

void AppendTraceContext(std::string& out) {
  if (!g_include_trace_context) return;

  auto span = opentelemetry::trace::GetSpan(opentelemetry::context::RuntimeContext::GetCurrent());
  if (!span) return;

  auto context = span->GetContext();
  if (!context.IsValid()) return;

  uint8_t trace_bytes[16];
  uint8_t span_bytes[8];
  context.trace_id().CopyBytesTo(trace_bytes);
  context.span_id().CopyBytesTo(span_bytes);
  out.append(" trace_id=").append(HexId(trace_bytes, 16));
  out.append(" span_id=").append(HexId(span_bytes, 8));
}
#else
void AppendTraceContext(std::string&) {}
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

LogField DurationField(std::string_view key, std::chrono::milliseconds value) {
  return {std::string(key), util::FormatMillis(value)};
}

std::optional<spdlog::level::level_enum> ParseLevel(std::string_view name) {
  if (name == "warn") return spdlog::level::warn;
  if (name == "err") return spdlog::level::err;
  for (int i = spdlog::level::trace; i < spdlog::level::n_levels; ++i) {
    const auto level = static_cast<spdlog::level::level_enum>(i);
    const auto label = spdlog::level::to_string_view(level);
    if (name == std::string_view(label.data(), label.size())) {
      return level;
    }
  }
  return std::nullopt;
}

void InitializeLogging(const meshdeploy::runtime::config::RuntimeConfig& config) {
  auto logger = spdlog::get(kLoggerName);
  if (!logger) {
    logger = spdlog::stdout_color_mt(kLoggerName);
  }
  logger->set_pattern(EnvOr("MESHDEPLOY_LOG_PATTERN", config.logging().pattern(), kDefaultPattern));

  const auto level_name = EnvOr("MESHDEPLOY_LOG_LEVEL", config.logging().level(), "info");
  const auto level      = ParseLevel(level_name);
  logger->set_level(level.value_or(spdlog::level::info));

  spdlog::set_default_logger(logger);
  spdlog::flush_on(spdlog::level::warn);
  g_include_trace_context = TraceContextEnabled(config);

  if (!level) {
    LogWarn("unknown log level, using info", {StringField("level", level_name)});
  }
}

void ShutdownLogging() {
  spdlog::shutdown();
}

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields) {
  if (!spdlog::should_log(level)) return;

  std::string line(message);
  AppendFields(line, fields);
  AppendTraceContext(line);
  spdlog::log(level, "{}", line);
}

void LogServiceOutput(spdlog::level::level_enum level, std::string_view service_id, std::string_view channel, std::string_view line) {
  Log(level, line, {StringField("service", service_id), StringField("stream", channel)});
}

} // namespace meshdeploy::observability
