#pragma once

#include <spdlog/common.h>

#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <memory>
#include <string>
#include <string_view>

namespace spdlog {
class logger;
}

namespace datalens::runtime::config {
class RuntimeConfig;
}

namespace datalens::observability {

/*
  Structured key=value logging on top of spdlog.

  Everything goes through the "datalens" logger, which writes to stderr so
  command output on stdout stays machine readable. The logger exists
  before InitializeLogging() is called; until then it takes its level from
  DATALENS_LOG_LEVEL or falls back to "warn".
*/

struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField SizeField(std::string_view key, std::size_t value);
LogField DoubleField(std::string_view key, double value);
LogField BoolField(std::string_view key, bool value);

// Accepts the spdlog level names ("trace" .. "off") plus "warning".
// Throws InvalidArgument for anything else.
spdlog::level::level_enum ParseLevel(std::string_view text);

// Environment wins over the config file, which wins over the defaults.
void InitializeLogging(const datalens::runtime::config::RuntimeConfig& config);
void ShutdownLogging();

std::shared_ptr<spdlog::logger> Logger();

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

} // namespace datalens::observability

#define DATALENS_LOG_DEBUG(message, ...) ::datalens::observability::LogDebug((message), ##__VA_ARGS__)
#define DATALENS_LOG_INFO(message, ...) ::datalens::observability::LogInfo((message), ##__VA_ARGS__)
#define DATALENS_LOG_WARN(message, ...) ::datalens::observability::LogWarn((message), ##__VA_ARGS__)
#define DATALENS_LOG_ERROR(message, ...) ::datalens::observability::LogError((message), ##__VA_ARGS__)
