#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <filesystem>
#include <initializer_list>
#include <string>
#include <string_view>

namespace pano::runtime::config {
class RuntimeConfig;
}

namespace pano::observability {

/*
  One key=value pair appended to a log line.

  Values containing whitespace, quotes or '=' are written double-quoted,
  so photo paths with spaces stay one field.
*/
struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField BoolField(std::string_view key, bool value);
LogField PathField(std::string_view key, const std::filesystem::path& value);

// Installs a stderr-only default logger so nothing logged before the config is read reaches stdout.
void InitializeBootstrapLogging();

// Level: PANO_LOG_LEVEL, then logging.level, then "info". Throws util::InvalidArgument on an unknown level name.
void InitializeLogging(const pano::runtime::config::RuntimeConfig& config);
void ShutdownLogging();

// Overrides the level chosen at initialization (CLI --verbose).
void SetLogLevel(spdlog::level::level_enum level);

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

} // namespace pano::observability

#define PANO_LOG_DEBUG(message, ...) ::pano::observability::LogDebug((message), ##__VA_ARGS__)
#define PANO_LOG_INFO(message, ...) ::pano::observability::LogInfo((message), ##__VA_ARGS__)
#define PANO_LOG_WARN(message, ...) ::pano::observability::LogWarn((message), ##__VA_ARGS__)
#define PANO_LOG_ERROR(message, ...) ::pano::observability::LogError((message), ##__VA_ARGS__)
