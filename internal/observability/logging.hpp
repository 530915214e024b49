#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace gate::runtime::config {
class RuntimeConfig;
}

namespace gate::observability {

struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);

// key=value pairs separated by spaces. Values that are empty or contain
// spaces, quotes, '=' or control characters are double-quoted and escaped.
std::string FormatFields(std::initializer_list<LogField> fields);

// Defaults apply when no config is available (tools, tests).
void InitializeLogging();
void InitializeLogging(const gate::runtime::config::RuntimeConfig& config);
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

} // namespace gate::observability

#define GATE_LOG_INFO(message, ...) ::gate::observability::LogInfo((message), ##__VA_ARGS__)
#define GATE_LOG_WARN(message, ...) ::gate::observability::LogWarn((message), ##__VA_ARGS__)
#define GATE_LOG_DEBUG(message, ...) ::gate::observability::LogDebug((message), ##__VA_ARGS__)
#define GATE_LOG_ERROR(message, ...) ::gate::observability::LogError((message), ##__VA_ARGS__)
