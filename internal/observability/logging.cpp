#include "internal/observability/logging.hpp"

#include <cstdlib>
#include <string>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "config/config.pb.h"

namespace modsync::observability {
namespace {

constexpr char kLoggerName[]     = "modsync";
constexpr char kDefaultLevel[]   = "info";
constexpr char kDefaultPattern[] = "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] %v";

// environment beats the config file, which beats the built-in default
std::string Setting(const char* env, const std::string& configured, const char* fallback) {
  if (const char* value = std::getenv(env); value && *value) return value;
  if (!configured.empty()) return configured;
  return fallback;
}

bool NeedsQuoting(const std::string& value) {
  if (value.empty()) return true;
  return value.find_first_of(" \t\"=") != std::string::npos;
}

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

std::string FormatFields(std::initializer_list<LogField> fields) {
  std::string out;
  for (const auto& field : fields) {
    if (!out.empty()) out += ' ';
    out += field.key;
    out += '=';
    if (!NeedsQuoting(field.value)) {
      out += field.value;
      continue;
    }

    out += '"';
    for (char c : field.value) {
      if (c == '"' || c == '\\') out += '\\';
      out += c;
    }
    out += '"';
  }
  return out;
}

void InitializeLogging(const modsync::runtime::config::RuntimeConfig& config) {
  const auto& logging = config.logging();

  // stdout is reserved for command output
  auto logger = spdlog::stderr_color_mt(kLoggerName);
  logger->set_pattern(Setting("MODSYNC_LOG_PATTERN", logging.pattern(), kDefaultPattern));
  logger->set_level(spdlog::level::from_str(Setting("MODSYNC_LOG_LEVEL", logging.level(), kDefaultLevel)));
  spdlog::set_default_logger(std::move(logger));
  spdlog::flush_on(spdlog::level::warn);
}

void ShutdownLogging() {
  spdlog::shutdown();
}

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields) {
  if (fields.size() == 0) {
    spdlog::log(level, "{}", message);
    return;
  }
  spdlog::log(level, "{} {}", message, FormatFields(fields));
}

} // namespace modsync::observability
