#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

#include "internal/util/decimal.hpp"

namespace pagewise::runtime::config {
class LoggingConfig;
}

namespace pagewise::observability {

// Name of the process-wide logger registered with spdlog.
inline constexpr const char* kLoggerName = "pagewise";

struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField BoolField(std::string_view key, bool value);
LogField DecimalField(std::string_view key, util::Decimal value, int places = 2);

/*
  Renders fields as `key=value` pairs separated by single spaces.
  Values that are empty or contain spaces, quotes or '=' are double quoted
  with embedded quotes and backslashes escaped, so a line splits back into
  the same pairs.
*/
std::string FormatFields(std::initializer_list<LogField> fields);

// Level and pattern come from config; PAGEWISE_LOG_LEVEL / PAGEWISE_LOG_PATTERN win.
// Safe to call more than once: the existing logger is reconfigured.
void InitializeLogging(const runtime::config::LoggingConfig& config);
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

} // namespace pagewise::observability

#define PAGEWISE_LOG_DEBUG(message, ...) ::pagewise::observability::LogDebug((message), ##__VA_ARGS__)
#define PAGEWISE_LOG_INFO(message, ...) ::pagewise::observability::LogInfo((message), ##__VA_ARGS__)
#define PAGEWISE_LOG_WARN(message, ...) ::pagewise::observability::LogWarn((message), ##__VA_ARGS__)
#define PAGEWISE_LOG_ERROR(message, ...) ::pagewise::observability::LogError((message), ##__VA_ARGS__)
