#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace modsync::runtime::config {
class RuntimeConfig;
}

namespace modsync::observability {

struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField BoolField(std::string_view key, bool value);

// key=value pairs separated by spaces; values with blanks, quotes or '='
// are double-quoted and escaped.
std::string FormatFields(std::initializer_list<LogField> fields);

void InitializeLogging(const modsync::runtime::config::RuntimeConfig& config);
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

} // namespace modsync::observability

#define MODSYNC_LOG_DEBUG(message, ...) ::modsync::observability::LogDebug((message), ##__VA_ARGS__)
#define MODSYNC_LOG_INFO(message, ...) ::modsync::observability::LogInfo((message), ##__VA_ARGS__)
#define MODSYNC_LOG_WARN(message, ...) ::modsync::observability::LogWarn((message), ##__VA_ARGS__)
#define MODSYNC_LOG_ERROR(message, ...) ::modsync::observability::LogError((message), ##__VA_ARGS__)
