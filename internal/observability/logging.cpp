#include "internal/observability/logging.hpp"

#include <cstdlib>
#include <memory>
#include <string>
#include <vector>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "config/config.pb.h"
#include "internal/util/errors.hpp"

namespace pano::observability {
namespace {

constexpr const char* kLoggerName     = "pano-manager";
constexpr const char* kDefaultPattern = "%Y-%m-%d %H:%M:%S [%^%l%$] %v";

std::string FromEnvOr(const char* name, const std::string& configured, const char* fallback) {
  if (const char* value = std::getenv(name); value && *value) {
    return value;
  }
  return configured.empty() ? std::string(fallback) : configured;
}

spdlog::level::level_enum ParseLevel(const std::string& name) {
  // from_str maps unknown names to "off", which would silence every error
  const auto level = spdlog::level::from_str(name);
  if (level == spdlog::level::off && name != "off") {
    throw pano::util::InvalidArgument("unknown log level: " + name);
  }
  return level;
}

bool NeedsQuotes(const std::string& value) {
  if (value.empty()) return true;
  return value.find_first_of(" \t\r\n\"=") != std::string::npos;
}

void AppendValue(std::string& out, const std::string& value) {
  if (!NeedsQuotes(value)) {
    out += value;
    return;
  }

  out.push_back('"');
  for (char c : value) {
    switch (c) {
      case '"':
        out += "\\\"";
        break;
      case '\\':
        out += "\\\\";
        break;
      case '\n':
        out += "\\n";
        break;
      default:
        out.push_back(c);
    }
  }
  out.push_back('"');
}

std::string SerializeFields(std::initializer_list<LogField> fields) {
  std::string out;
  for (const auto& field : fields) {
    if (!out.empty()) out.push_back(' ');
    out += field.key;
    out.push_back('=');
    AppendValue(out, field.value);
  }
  return out;
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

LogField PathField(std::string_view key, const std::filesystem::path& value) {
  return {std::string(key), value.string()};
}

void InitializeBootstrapLogging() {
  auto logger = std::make_shared<spdlog::logger>(kLoggerName, std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
  logger->set_pattern(kDefaultPattern);
  logger->set_level(spdlog::level::info);
  spdlog::set_default_logger(std::move(logger));
}

void InitializeLogging(const pano::runtime::config::RuntimeConfig& config) {
  const auto level   = ParseLevel(FromEnvOr("PANO_LOG_LEVEL", config.logging().level(), "info"));
  const auto pattern = FromEnvOr("PANO_LOG_PATTERN", config.logging().pattern(), kDefaultPattern);

  // stdout carries command output; logs go to stderr and the optional file
  std::vector<spdlog::sink_ptr> sinks;
  sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
  if (!config.logging().file().empty()) {
    sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(config.logging().file(), /*truncate=*/false));
  }

  auto logger = std::make_shared<spdlog::logger>(kLoggerName, sinks.begin(), sinks.end());
  logger->set_pattern(pattern);
  logger->set_level(level);
  spdlog::set_default_logger(std::move(logger));
  spdlog::flush_on(spdlog::level::warn);
}

void ShutdownLogging() {
  spdlog::shutdown();
}

void SetLogLevel(spdlog::level::level_enum level) {
  spdlog::set_level(level);
}

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields) {
  if (!spdlog::should_log(level)) {
    return;
  }

  const auto serialized = SerializeFields(fields);
  if (serialized.empty()) {
    spdlog::log(level, "{}", message);
    return;
  }
  spdlog::log(level, "{} {}", message, serialized);
}

} // namespace pano::observability
