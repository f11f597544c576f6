#pragma once

#include <spdlog/common.h>

#include <chrono>
#include <cstdint>
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>

namespace meshdeploy::runtime::config {
class RuntimeConfig;
}

namespace meshdeploy::observability {

/*
  Structured key=value logging on top of the "meshdeploy" spdlog logger.

  Values containing whitespace, '=' or '"' are quoted so a line can be split
  back into fields. Orchestrator messages and forwarded service output share
  the logger; service output carries service= and stream= fields.
*/

struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField BoolField(std::string_view key, bool value);
LogField DurationField(std::string_view key, std::chrono::milliseconds value);

// Accepts spdlog level names plus "warn" and "err"; nullopt for anything else.
std::optional<spdlog::level::level_enum> ParseLevel(std::string_view name);

void InitializeLogging(const meshdeploy::runtime::config::RuntimeConfig& config);
void ShutdownLogging();

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields = {});

// Output of a service nobody is subscribed to.
void LogServiceOutput(spdlog::level::level_enum level, std::string_view service_id, std::string_view channel, std::string_view line);

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

} // namespace meshdeploy::observability

#define MESHDEPLOY_LOG_DEBUG(message, ...) ::meshdeploy::observability::LogDebug((message), ##__VA_ARGS__)
#define MESHDEPLOY_LOG_INFO(message, ...) ::meshdeploy::observability::LogInfo((message), ##__VA_ARGS__)
#define MESHDEPLOY_LOG_WARN(message, ...) ::meshdeploy::observability::LogWarn((message), ##__VA_ARGS__)
#define MESHDEPLOY_LOG_ERROR(message, ...) ::meshdeploy::observability::LogError((message), ##__VA_ARGS__)
