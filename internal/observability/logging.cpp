#include "internal/observability/logging.hpp"

#include <cstdlib>
#include <memory>
#include <string>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "config/config.pb.h"

namespace pagewise::observability {
namespace {

constexpr const char* kDefaultPattern = "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] %v";

const char* EnvOrNull(const char* name) {
  const char* value = std::getenv(name);
  return value != nullptr && *value != '\0' ? value : nullptr;
}

// spdlog maps unknown names to "off"; a typo must not silence the tool.
spdlog::level::level_enum ResolveLevel(const runtime::config::LoggingConfig& config, std::string& rejected) {
  std::string name = "info";
  if (const char* env = EnvOrNull("PAGEWISE_LOG_LEVEL")) {
    name = env;
  } else if (!config.level().empty()) {
    name = config.level();
  }

  const auto level = spdlog::level::from_str(name);
  if (level == spdlog::level::off && name != "off") {
    rejected = name;
    return spdlog::level::info;
  }
  return level;
}

std::string ResolvePattern(const runtime::config::LoggingConfig& config) {
  if (const char* env = EnvOrNull("PAGEWISE_LOG_PATTERN")) return env;
  return config.pattern().empty() ? kDefaultPattern : config.pattern();
}

bool NeedsQuotes(std::string_view value) {
  if (value.empty()) return true;
  for (char c : value) {
    if (c == ' ' || c == '\t' || c == '"' || c == '=' || c == '\n') return true;
  }
  return false;
}

void AppendValue(std::string& out, std::string_view value) {
  if (!NeedsQuotes(value)) {
    out += value;
    return;
  }
  out += '"';
  for (char c : value) {
    if (c == '"' || c == '\\') out += '\\';
    out += c == '\n' ? ' ' : c;
  }
  out += '"';
}

std::shared_ptr<spdlog::logger> Logger() {
  if (auto logger = spdlog::get(kLoggerName)) return logger;
  return spdlog::default_logger();
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

LogField DecimalField(std::string_view key, util::Decimal value, int places) {
  return {std::string(key), value.ToString(places)};
}

std::string FormatFields(std::initializer_list<LogField> fields) {
  std::string out;
  for (const auto& field : fields) {
    if (!out.empty()) out += ' ';
    out += field.key;
    out += '=';
    AppendValue(out, field.value);
  }
  return out;
}

void InitializeLogging(const runtime::config::LoggingConfig& config) {
  // Results go to stdout; diagnostics go to stderr.
  auto logger = spdlog::get(kLoggerName);
  if (!logger) logger = spdlog::stderr_color_mt(kLoggerName);

  std::string rejected;
  logger->set_level(ResolveLevel(config, rejected));
  logger->set_pattern(ResolvePattern(config));
  logger->flush_on(spdlog::level::warn);
  spdlog::set_default_logger(logger);

  if (!rejected.empty()) {
    Log(spdlog::level::warn, "unknown log level, using info", {StringField("level", rejected)});
  }
}

void ShutdownLogging() {
  if (auto logger = spdlog::get(kLoggerName)) logger->flush();
  spdlog::shutdown();
}

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields) {
  auto logger = Logger();
  if (!logger->should_log(level)) return;

  if (fields.size() == 0) {
    logger->log(level, "{}", message);
    return;
  }
  logger->log(level, "{} {}", message, FormatFields(fields));
}

} // namespace pagewise::observability
