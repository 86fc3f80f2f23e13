#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace mlmeta::runtime::config {
class RuntimeConfig;
}

namespace mlmeta::observability {

struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField BoolField(std::string_view key, bool value);

/*
  Console logger, plus a size-rotated file when `logging.file` is set.
  MLMETA_LOG_LEVEL and MLMETA_LOG_PATTERN override the config. Throws
  std::invalid_argument on an unknown level name.
*/
void InitializeLogging(const mlmeta::runtime::config::RuntimeConfig& config);
void ShutdownLogging();

// `message key=value ...` in logfmt: values holding spaces, quotes or '='
// (filter expressions, document paths) are double-quoted and escaped.
std::string FormatLogLine(std::string_view message, std::initializer_list<LogField> fields);

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

} // namespace mlmeta::observability

#define MLMETA_LOG_DEBUG(message, ...) ::mlmeta::observability::LogDebug((message), ##__VA_ARGS__)
#define MLMETA_LOG_INFO(message, ...) ::mlmeta::observability::LogInfo((message), ##__VA_ARGS__)
#define MLMETA_LOG_WARN(message, ...) ::mlmeta::observability::LogWarn((message), ##__VA_ARGS__)
#define MLMETA_LOG_ERROR(message, ...) ::mlmeta::observability::LogError((message), ##__VA_ARGS__)
