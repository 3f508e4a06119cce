#include "duration.hpp"

#include <cstdint>
#include <cstdio>
#include <vector>

#include "internal/util/errors.hpp"

namespace pagewise::util {

namespace {

std::int64_t ParseField(std::string_view field, std::string_view whole) {
  if (field.empty() || field.size() > 9) {
    throw InvalidRawValue("malformed duration: '" + std::string(whole) + "'");
  }
  std::int64_t value = 0;
  for (char c : field) {
    if (c < '0' || c > '9') {
      throw InvalidRawValue("malformed duration: '" + std::string(whole) + "'");
    }
    value = value * 10 + (c - '0');
  }
  return value;
}

} // namespace

std::chrono::seconds ParseDuration(std::string_view text) {
  std::vector<std::string_view> fields;
  std::size_t                   start = 0;
  while (true) {
    const auto colon = text.find(':', start);
    fields.push_back(text.substr(start, colon == std::string_view::npos ? std::string_view::npos : colon - start));
    if (colon == std::string_view::npos) break;
    start = colon + 1;
  }

  if (fields.size() > 3) {
    throw InvalidRawValue("malformed duration: '" + std::string(text) + "'");
  }

  std::int64_t total = 0;
  for (std::size_t i = 0; i < fields.size(); ++i) {
    const auto value = ParseField(fields[i], text);
    if (i > 0 && value >= 60) {
      throw InvalidRawValue("malformed duration: '" + std::string(text) + "'");
    }
    total = total * 60 + value;
  }
  return std::chrono::seconds(total);
}

std::string FormatDuration(std::chrono::seconds value) {
  const auto total   = value.count() < 0 ? 0 : value.count();
  const auto hours   = total / 3600;
  const auto minutes = (total % 3600) / 60;
  const auto seconds = total % 60;

  char buffer[32];
  std::snprintf(buffer, sizeof(buffer), "%02lld:%02lld:%02lld", static_cast<long long>(hours), static_cast<long long>(minutes),
                static_cast<long long>(seconds));
  return buffer;
}

} // namespace pagewise::util
