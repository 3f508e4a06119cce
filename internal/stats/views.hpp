#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "internal/model/medium.hpp"
#include "internal/util/decimal.hpp"
#include "internal/util/time.hpp"

namespace pagewise::stats {

/*
  Read-side views. Everything here is derived from the reading ledger and
  completion records on each call; nothing is cached or stored.
*/

using MediumTotals = std::map<model::Medium, util::Decimal>;

enum class Period {
  kDay,
  kWeek,  // the 7 days ending on the anchor
  kMonth, // calendar month of the anchor
  kYear,  // calendar year of the anchor
};

struct DailyTotal {
  util::Date               date{};
  util::Decimal            pages;
  std::int64_t             audio_seconds = 0;
  MediumTotals             pages_by_medium;
  std::vector<std::string> books; // sorted, distinct

  bool HasActivity() const {
    return util::Decimal{} < pages || audio_seconds > 0;
  }
};

struct BestDay {
  util::Date    date{};
  util::Decimal pages;
};

struct PeriodSummary {
  util::DateRange range;

  util::Decimal                total_pages;
  int                          reading_days = 0;
  std::optional<util::Decimal> average_pages_per_day;
  std::optional<BestDay>       best_day;
  std::int64_t                 audio_seconds = 0;

  MediumTotals pages_by_medium;
  MediumTotals share_percent;

  int                      books_completed = 0;
  std::vector<std::string> completed_books;
};

struct CalendarCell {
  util::Date               date{};
  bool                     in_month = true;
  util::Decimal            pages;
  std::vector<std::string> books;
  std::int64_t             audio_minutes = 0;
  bool                     completed     = false;
  std::vector<std::string> completed_books;
};

struct CalendarMonth {
  int      year  = 0;
  unsigned month = 0;

  std::vector<CalendarCell> days; // one per day of the month
  // Monday-first grid; leading/trailing cells from adjacent months have in_month == false.
  std::vector<std::vector<CalendarCell>> weeks;

  bool       has_activity = false;
  util::Date previous_month{};
  util::Date next_month{};
};

struct Run {
  util::Date from{};
  util::Date to{};
  int        days = 0;
};

struct Streaks {
  std::optional<Run> longest_active;
  std::optional<Run> longest_idle;
  // Active days ending on the last day of the range; 0 when that day is idle.
  int current = 0;
};

struct BookStat {
  std::string   book_id;
  util::Decimal pages;
  std::int64_t  audio_seconds = 0;
  int           reading_days  = 0;
};

struct LeaderboardEntry {
  int           rank = 0;
  std::string   reader_id;
  util::Decimal pages;
  int           reading_days = 0;
};

struct Forecast {
  std::uint64_t                progress_id = 0;
  std::optional<std::int64_t>  pages_left;
  std::optional<util::Decimal> average_pages_per_day;
  int                          reading_days = 0;
  std::optional<std::int64_t>  days_remaining;
};

} // namespace pagewise::stats
