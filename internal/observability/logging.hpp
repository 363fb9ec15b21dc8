#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>

namespace permit::runtime::config {
class RuntimeConfig;
}

namespace permit::observability {

struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField BoolField(std::string_view key, bool value);

// "debug", "info", "warn", ... as spdlog spells them. Empty for anything else.
std::optional<spdlog::level::level_enum> ParseLevel(std::string_view name);

// key=value pairs separated by spaces; values with spaces or quotes are quoted.
std::string FormatFields(std::initializer_list<LogField> fields);

// Level and pattern come from PERMIT_LOG_LEVEL / PERMIT_LOG_PATTERN, then the
// logging config section, then defaults. Output goes to stderr so permitctl
// keeps stdout for results.
void InitializeLogging(const permit::runtime::config::RuntimeConfig& config);
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

} // namespace permit::observability

#define PERMIT_LOG_DEBUG(message, ...) ::permit::observability::LogDebug((message), ##__VA_ARGS__)
#define PERMIT_LOG_INFO(message, ...) ::permit::observability::LogInfo((message), ##__VA_ARGS__)
#define PERMIT_LOG_WARN(message, ...) ::permit::observability::LogWarn((message), ##__VA_ARGS__)
#define PERMIT_LOG_ERROR(message, ...) ::permit::observability::LogError((message), ##__VA_ARGS__)
