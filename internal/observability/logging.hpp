#pragma once

#include <spdlog/common.h>

#include <chrono>
#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace jobq::runtime::config {
class RuntimeConfig;
}

namespace jobq::observability {

// key=value pairs appended to a log line; values with spaces are quoted.
struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
// Rendered as "<n>ms".
LogField DurationField(std::string_view key, std::chrono::milliseconds value);

void InitializeLogging(const jobq::runtime::config::RuntimeConfig& config);
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

} // namespace jobq::observability

#define JOBQ_LOG_DEBUG(message, ...) ::jobq::observability::LogDebug((message), ##__VA_ARGS__)
#define JOBQ_LOG_INFO(message, ...) ::jobq::observability::LogInfo((message), ##__VA_ARGS__)
#define JOBQ_LOG_WARN(message, ...) ::jobq::observability::LogWarn((message), ##__VA_ARGS__)
#define JOBQ_LOG_ERROR(message, ...) ::jobq::observability::LogError((message), ##__VA_ARGS__)
