#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace upload::runtime::config {
class RuntimeConfig;
}

namespace upload::observability {

/*
  Structured logging on top of the spdlog default logger "upload-manager".

  Lines render as `message key=value key="quoted value" [trace_id=.. span_id=..]`.

  Level, pattern and an optional file sink come from the `logging` config
  section; UPLOAD_LOG_LEVEL / UPLOAD_LOG_PATTERN / UPLOAD_LOG_FILE override it.
*/

struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField SizeField(std::string_view key, std::uint64_t bytes);
LogField BoolField(std::string_view key, bool value);

// Presigned URLs carry credentials in the query string; only scheme, host
// and path are kept.
LogField UrlField(std::string_view key, std::string_view url);

void InitializeLogging(const upload::runtime::config::RuntimeConfig& config);
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

} // namespace upload::observability

#define UPLOAD_LOG_DEBUG(message, ...) ::upload::observability::LogDebug((message), ##__VA_ARGS__)
#define UPLOAD_LOG_INFO(message, ...) ::upload::observability::LogInfo((message), ##__VA_ARGS__)
#define UPLOAD_LOG_WARN(message, ...) ::upload::observability::LogWarn((message), ##__VA_ARGS__)
#define UPLOAD_LOG_ERROR(message, ...) ::upload::observability::LogError((message), ##__VA_ARGS__)
