#include "time.hpp"

#include <cstdio>
#include <stdexcept>

namespace pagewise::util {

using std::chrono::days;
using std::chrono::sys_days;

TimePoint Now() {
  return Clock::now();
}

uint64_t ToUnixMillis(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

TimePoint FromUnixMillis(uint64_t ms) {
  return TimePoint{} + std::chrono::milliseconds(ms);
}

Date ToLocalDate(TimePoint tp, std::chrono::minutes utc_offset) {
  return Date{std::chrono::floor<days>(tp + utc_offset)};
}

TimePoint AtLocalNoon(Date date, std::chrono::minutes utc_offset) {
  return TimePoint{sys_days{date}} + std::chrono::hours(12) - utc_offset;
}

Date MakeDate(int year, unsigned month, unsigned day) {
  const Date date{std::chrono::year{year}, std::chrono::month{month}, std::chrono::day{day}};
  if (!date.ok()) {
    throw std::invalid_argument("invalid calendar date");
  }
  return date;
}

Date AddDays(Date date, int count) {
  return Date{sys_days{date} + days{count}};
}

int DaysBetweenInclusive(Date from, Date to) {
  if (to < from) {
    return 0;
  }
  return static_cast<int>((sys_days{to} - sys_days{from}).count()) + 1;
}

Date FirstDayOfMonth(int year, unsigned month) {
  return MakeDate(year, month, 1);
}

Date LastDayOfMonth(int year, unsigned month) {
  const std::chrono::year_month_day_last last{std::chrono::year{year},
                                              std::chrono::month_day_last{std::chrono::month{month}}};
  if (!last.ok()) {
    throw std::invalid_argument("invalid calendar month");
  }
  return Date{last};
}

unsigned WeekdayIndex(Date date) {
  // iso_encoding: Monday = 1 ... Sunday = 7
  return std::chrono::weekday{sys_days{date}}.iso_encoding() - 1;
}

std::string FormatDate(Date date) {
  char buffer[16];
  std::snprintf(buffer, sizeof(buffer), "%04d-%02u-%02u", static_cast<int>(date.year()), static_cast<unsigned>(date.month()),
                static_cast<unsigned>(date.day()));
  return buffer;
}

Date ParseDate(std::string_view text) {
  int      year  = 0;
  unsigned month = 0;
  unsigned day   = 0;
  char     tail  = '\0';

  const std::string copy(text);
  if (std::sscanf(copy.c_str(), "%4d-%2u-%2u%c", &year, &month, &day, &tail) != 3) {
    throw std::invalid_argument("malformed date (expected YYYY-MM-DD): " + copy);
  }
  return MakeDate(year, month, day);
}

std::vector<Date> EnumerateDays(const DateRange& range) {
  std::vector<Date> out;
  for (auto day = sys_days{range.from}; day <= sys_days{range.to}; day += days{1}) {
    out.emplace_back(day);
  }
  return out;
}

} // namespace pagewise::util
