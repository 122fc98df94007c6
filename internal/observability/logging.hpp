#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace modeldb::runtime::config {
class RuntimeConfig;
}

namespace modeldb::observability {

/*
  Structured logging for modeldb-deploy on top of one spdlog logger
  named "modeldb", writing to stderr.

  Level and pattern come from RuntimeConfig.logging; MODELDB_LOG_LEVEL
  and MODELDB_LOG_PATTERN override both. Fields are appended to the
  message as key=value pairs.
*/

struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField BoolField(std::string_view key, bool value);

// Safe to call more than once; later calls reconfigure the same logger.
void InitializeLogging(const modeldb::runtime::config::RuntimeConfig& config);
void ShutdownLogging();

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields = {});

inline void LogInfo(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::info, message, fields);
}

inline void LogWarn(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::warn, message, fields);
}

inline void LogError(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::err, message, fields);
}

} // namespace modeldb::observability

#define MODELDB_LOG_INFO(message, ...) ::modeldb::observability::LogInfo((message), ##__VA_ARGS__)
#define MODELDB_LOG_WARN(message, ...) ::modeldb::observability::LogWarn((message), ##__VA_ARGS__)
#define MODELDB_LOG_ERROR(message, ...) ::modeldb::observability::LogError((message), ##__VA_ARGS__)
