#include "internal/observability/logging.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <mutex>
#include <sstream>
#include <string>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "config/config.pb.h"
#include "internal/util/errors.hpp"

namespace datalens::observability {
namespace {

constexpr const char* kLoggerName     = "datalens";
constexpr const char* kDefaultPattern = "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] %v";

const char* Env(const char* name) {
  const char* value = std::getenv(name);
  return value && *value ? value : nullptr;
}

std::mutex& LoggerMutex() {
  static std::mutex mutex;
  return mutex;
}

// Values with spaces, quotes or '=' are quoted so record names such as
// "Iron Sword" keep a line splittable into key=value pairs.
std::string QuoteIfNeeded(const std::string& value) {
  const bool plain = !value.empty() && std::none_of(value.begin(), value.end(), [](unsigned char c) { return std::isspace(c) || c == '"' || c == '='; });
  if (plain) {
    return value;
  }

  std::string out = "\"";
  for (const char c : value) {
    if (c == '"' || c == '\\') out += '\\';
    out += c;
  }
  out += '"';
  return out;
}

std::string SerializeFields(std::initializer_list<LogField> fields) {
  std::ostringstream out;
  bool               first = true;
  for (const auto& field : fields) {
    if (!first) {
      out << ' ';
    }
    first = false;
    out << field.key << '=' << QuoteIfNeeded(field.value);
  }
  return out.str();
}

std::shared_ptr<spdlog::logger> GetOrCreateLocked() {
  if (auto logger = spdlog::get(kLoggerName)) {
    return logger;
  }

  auto logger = spdlog::stderr_color_mt(kLoggerName);
  logger->set_pattern(Env("DATALENS_LOG_PATTERN") ? Env("DATALENS_LOG_PATTERN") : kDefaultPattern);
  logger->set_level(spdlog::level::warn);
  if (const char* level = Env("DATALENS_LOG_LEVEL")) {
    // a bad value here is reported by InitializeLogging()
    const auto parsed = spdlog::level::from_str(level);
    if (parsed != spdlog::level::off || std::string_view(level) == "off") logger->set_level(parsed);
  }
  return logger;
}

} // namespace

LogField StringField(std::string_view key, std::string_view value) {
  return {std::string(key), std::string(value)};
}

LogField IntField(std::string_view key, std::int64_t value) {
  return {std::string(key), std::to_string(value)};
}

LogField SizeField(std::string_view key, std::size_t value) {
  return {std::string(key), std::to_string(value)};
}

LogField DoubleField(std::string_view key, double value) {
  std::ostringstream out;
  out << value;
  return {std::string(key), out.str()};
}

LogField BoolField(std::string_view key, bool value) {
  return {std::string(key), value ? "true" : "false"};
}

spdlog::level::level_enum ParseLevel(std::string_view text) {
  std::string lowered(text);
  std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  if (lowered == "warning") return spdlog::level::warn;
  if (lowered == "error") return spdlog::level::err;

  // from_str() maps unknown names to "off"
  const auto level = spdlog::level::from_str(lowered);
  if (level == spdlog::level::off && lowered != "off") {
    throw util::InvalidArgument("unknown log level '" + std::string(text) + "'");
  }
  return level;
}

void InitializeLogging(const datalens::runtime::config::RuntimeConfig& config) {
  std::string level = "info";
  if (const char* env = Env("DATALENS_LOG_LEVEL")) {
    level = env;
  } else if (!config.logging().level().empty()) {
    level = config.logging().level();
  }

  std::string pattern = kDefaultPattern;
  if (const char* env = Env("DATALENS_LOG_PATTERN")) {
    pattern = env;
  } else if (!config.logging().pattern().empty()) {
    pattern = config.logging().pattern();
  }

  const auto parsed = ParseLevel(level);

  std::lock_guard lock(LoggerMutex());
  auto            logger = GetOrCreateLocked();
  logger->set_pattern(pattern);
  logger->set_level(parsed);
  logger->flush_on(spdlog::level::warn);
}

void ShutdownLogging() {
  std::lock_guard lock(LoggerMutex());
  if (auto logger = spdlog::get(kLoggerName)) {
    logger->flush();
  }
  spdlog::drop(kLoggerName);
}

std::shared_ptr<spdlog::logger> Logger() {
  std::lock_guard lock(LoggerMutex());
  return GetOrCreateLocked();
}

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields) {
  const auto logger = Logger();
  // skip field formatting for debug lines on the per-record paths
  if (!logger->should_log(level)) {
    return;
  }

  const auto serialized_fields = SerializeFields(fields);
  if (!serialized_fields.empty()) {
    logger->log(level, "{} {}", message, serialized_fields);
    return;
  }
  logger->log(level, "{}", message);
}

} // namespace datalens::observability
