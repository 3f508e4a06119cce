#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace pagewise::util {

/*
  Time utilities: clock source and calendar math.

  Dates are reader-local calendar days. A TimePoint is mapped onto a date with
  a fixed UTC offset supplied by the caller (configuration or per reader).
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;
using Date      = std::chrono::year_month_day;

TimePoint Now();

uint64_t  ToUnixMillis(TimePoint tp);
TimePoint FromUnixMillis(uint64_t ms);

Date ToLocalDate(TimePoint tp, std::chrono::minutes utc_offset);

// Midday of `date` in the given offset; handy for tests and CLI input.
TimePoint AtLocalNoon(Date date, std::chrono::minutes utc_offset);

Date MakeDate(int year, unsigned month, unsigned day);
Date AddDays(Date date, int days);

// Inclusive count of days from `from` to `to`; 0 when to < from.
int DaysBetweenInclusive(Date from, Date to);

Date FirstDayOfMonth(int year, unsigned month);
Date LastDayOfMonth(int year, unsigned month);

// Monday = 0 ... Sunday = 6.
unsigned WeekdayIndex(Date date);

// "YYYY-MM-DD"
std::string FormatDate(Date date);
// Throws std::invalid_argument on malformed or impossible dates.
Date ParseDate(std::string_view text);

struct DateRange {
  Date from{};
  Date to{};

  bool Contains(Date date) const {
    return from <= date && date <= to;
  }
  int Days() const {
    return DaysBetweenInclusive(from, to);
  }
};

std::vector<Date> EnumerateDays(const DateRange& range);

} // namespace pagewise::util
