#pragma once

#include <spdlog/common.h>

#include <chrono>
#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace release::runtime::config {
class RuntimeConfig;
}

namespace release::observability {

struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField BoolField(std::string_view key, bool value);
// Rendered as "<n>ms".
LogField DurationField(std::string_view key, std::chrono::milliseconds value);

/*
  Installs the process-wide "release-coordinator" logger.

  Level and pattern resolve env -> config -> default
  (RELEASE_LOG_LEVEL, RELEASE_LOG_PATTERN). When logging.file_path is set a
  rotating file sink is attached beside stdout.

  Before this runs, logging goes to spdlog's default logger; tests rely on
  that.
*/
void InitializeLogging(const release::runtime::config::RuntimeConfig& config);
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

} // namespace release::observability

#define RELEASE_LOG_DEBUG(message, ...) ::release::observability::LogDebug((message), ##__VA_ARGS__)
#define RELEASE_LOG_INFO(message, ...) ::release::observability::LogInfo((message), ##__VA_ARGS__)
#define RELEASE_LOG_WARN(message, ...) ::release::observability::LogWarn((message), ##__VA_ARGS__)
#define RELEASE_LOG_ERROR(message, ...) ::release::observability::LogError((message), ##__VA_ARGS__)
