#include "aggregator.hpp"

#include <algorithm>
#include <set>
#include <stdexcept>
#include <unordered_map>

#include "internal/catalog/book_catalog.hpp"
#include "internal/equivalence/converter.hpp"
#include "internal/util/errors.hpp"

namespace pagewise::stats {

namespace {

void ValidateRange(const util::DateRange& range) {
  if (range.to < range.from) {
    throw util::InvalidRawValue("date range ends before it starts: " + util::FormatDate(range.from) + " > " + util::FormatDate(range.to));
  }
}

template <typename Fn>
auto ReadOnly(db::Repository& repository, std::string_view operation, Fn&& fn) {
  try {
    auto tx  = repository.Begin();
    auto out = fn(*tx);
    tx->Commit();
    return out;
  } catch (const util::EngineError&) {
    throw;
  } catch (const std::exception& ex) {
    throw util::StorageFailure(std::string(operation) + ": " + ex.what());
  }
}

std::size_t DayIndex(const util::DateRange& range, util::Date date) {
  return static_cast<std::size_t>(util::DaysBetweenInclusive(range.from, date) - 1);
}

void InsertSorted(std::vector<std::string>& values, const std::string& value) {
  auto it = std::lower_bound(values.begin(), values.end(), value);
  if (it == values.end() || *it != value) values.insert(it, value);
}

// total / days, 2 dp half-up.
util::Decimal Average(util::Decimal total, int days) {
  return util::Decimal::FromRatio(total.Units(), static_cast<std::int64_t>(days) * util::Decimal::kScale, 2);
}

std::vector<DailyTotal> Bucket(const util::DateRange& range, const std::vector<model::LedgerEntry>& entries) {
  std::vector<DailyTotal> days;
  for (auto date : util::EnumerateDays(range)) {
    DailyTotal day;
    day.date = date;
    days.push_back(std::move(day));
  }

  for (const auto& e : entries) {
    if (!range.Contains(e.log_date)) continue;
    auto& day = days[DayIndex(range, e.log_date)];
    day.pages += e.pages_equivalent;
    day.audio_seconds += e.audio_seconds;
    day.pages_by_medium[e.medium] += e.pages_equivalent;
    InsertSorted(day.books, e.book_id);
  }
  return days;
}

} // namespace

util::DateRange PeriodRange(Period period, util::Date anchor) {
  const int      year  = static_cast<int>(anchor.year());
  const unsigned month = static_cast<unsigned>(anchor.month());

  switch (period) {
    case Period::kDay:
      return {anchor, anchor};
    case Period::kWeek:
      return {util::AddDays(anchor, -6), anchor};
    case Period::kMonth:
      return {util::FirstDayOfMonth(year, month), util::LastDayOfMonth(year, month)};
    case Period::kYear:
      return {util::MakeDate(year, 1, 1), util::MakeDate(year, 12, 31)};
  }
  throw std::invalid_argument("unknown period");
}

Aggregator::Aggregator(std::shared_ptr<db::Repository> repository, std::shared_ptr<catalog::BookCatalog> catalog)
    : repository_(std::move(repository)), catalog_(std::move(catalog)) {
  if (!repository_) {
    throw std::invalid_argument("aggregator requires a repository");
  }
}

std::vector<model::LedgerEntry> Aggregator::ReadLedger(const db::LedgerQuery& query) {
  return ReadOnly(*repository_, "read ledger", [&](db::Transaction& tx) { return repository_->ReadLedger(tx, query); });
}

Aggregator::Activity Aggregator::ReadActivity(const std::string& reader_id, const util::DateRange& range) {
  return ReadOnly(*repository_, "read activity", [&](db::Transaction& tx) {
    Activity activity;
    activity.days        = Bucket(range, repository_->ReadLedger(tx, {.reader_id = reader_id, .from = range.from, .to = range.to}));
    activity.completions = repository_->ListCompletions(tx, {.reader_id = reader_id, .from = range.from, .to = range.to});
    return activity;
  });
}

// ------------------------------------------------------------
// Daily totals / summaries
// ------------------------------------------------------------

std::vector<DailyTotal> Aggregator::DailyTotals(const std::string& reader_id, const util::DateRange& range) {
  ValidateRange(range);
  return Bucket(range, ReadLedger({.reader_id = reader_id, .from = range.from, .to = range.to}));
}

PeriodSummary Aggregator::Summary(const std::string& reader_id, Period period, util::Date anchor) {
  return Summary(reader_id, PeriodRange(period, anchor));
}

PeriodSummary Aggregator::Summary(const std::string& reader_id, const util::DateRange& range) {
  ValidateRange(range);

  PeriodSummary summary;
  summary.range = range;

  const auto activity = ReadActivity(reader_id, range);
  for (const auto& day : activity.days) {
    summary.total_pages += day.pages;
    summary.audio_seconds += day.audio_seconds;
    for (const auto& [medium, pages] : day.pages_by_medium) summary.pages_by_medium[medium] += pages;

    if (!day.HasActivity()) continue;
    ++summary.reading_days;
    if (!summary.best_day || summary.best_day->pages < day.pages) summary.best_day = BestDay{day.date, day.pages};
  }

  if (summary.reading_days > 0) summary.average_pages_per_day = Average(summary.total_pages, summary.reading_days);

  if (util::Decimal{} < summary.total_pages) {
    for (const auto& [medium, pages] : summary.pages_by_medium) {
      summary.share_percent[medium] = util::Decimal::FromRatio(pages.Units() * 100, summary.total_pages.Units(), 2);
    }
  }

  for (const auto& completion : activity.completions) {
    ++summary.books_completed;
    InsertSorted(summary.completed_books, completion.book_id);
  }
  return summary;
}

// ------------------------------------------------------------
// Calendar
// ------------------------------------------------------------

CalendarMonth Aggregator::Calendar(const std::string& reader_id, int year, unsigned month) {
  if (month < 1 || month > 12) {
    throw util::InvalidRawValue("month must be within 1-12, got " + std::to_string(month));
  }

  const util::DateRange range{util::FirstDayOfMonth(year, month), util::LastDayOfMonth(year, month)};

  CalendarMonth calendar;
  calendar.year           = year;
  calendar.month          = month;
  calendar.previous_month = month == 1 ? util::FirstDayOfMonth(year - 1, 12) : util::FirstDayOfMonth(year, month - 1);
  calendar.next_month     = month == 12 ? util::FirstDayOfMonth(year + 1, 1) : util::FirstDayOfMonth(year, month + 1);

  const auto activity = ReadActivity(reader_id, range);
  for (const auto& day : activity.days) {
    CalendarCell cell;
    cell.date          = day.date;
    cell.pages         = day.pages;
    cell.books         = day.books;
    cell.audio_minutes = util::CeilDiv(day.audio_seconds, 60);
    calendar.has_activity |= day.HasActivity();
    calendar.days.push_back(std::move(cell));
  }

  for (const auto& completion : activity.completions) {
    auto& cell     = calendar.days[DayIndex(range, completion.completed_on)];
    cell.completed = true;
    InsertSorted(cell.completed_books, completion.book_id);
    calendar.has_activity = true;
  }

  const auto grid_from = util::AddDays(range.from, -static_cast<int>(util::WeekdayIndex(range.from)));
  const auto grid_to   = util::AddDays(range.to, 6 - static_cast<int>(util::WeekdayIndex(range.to)));

  std::vector<CalendarCell> week;
  for (auto date : util::EnumerateDays({grid_from, grid_to})) {
    if (range.Contains(date)) {
      week.push_back(calendar.days[DayIndex(range, date)]);
    } else {
      CalendarCell outside;
      outside.date     = date;
      outside.in_month = false;
      week.push_back(std::move(outside));
    }
    if (week.size() == 7) {
      calendar.weeks.push_back(std::move(week));
      week.clear();
    }
  }
  return calendar;
}

// ------------------------------------------------------------
// Streaks
// ------------------------------------------------------------

Streaks Aggregator::StreaksFor(const std::string& reader_id, const util::DateRange& range) {
  Streaks streaks;

  std::optional<Run> active;
  std::optional<Run> idle;

  // Earliest run wins a tie.
  auto close = [](std::optional<Run>& run, std::optional<Run>& best) {
    if (run && (!best || best->days < run->days)) best = run;
    run.reset();
  };
  auto extend = [](std::optional<Run>& run, util::Date date) {
    if (!run) run = Run{date, date, 0};
    run->to = date;
    ++run->days;
  };

  for (const auto& day : DailyTotals(reader_id, range)) {
    if (day.HasActivity()) {
      close(idle, streaks.longest_idle);
      extend(active, day.date);
    } else {
      close(active, streaks.longest_active);
      extend(idle, day.date);
    }
  }

  streaks.current = active ? active->days : 0;
  close(active, streaks.longest_active);
  close(idle, streaks.longest_idle);
  return streaks;
}

// ------------------------------------------------------------
// Per-book / leaderboard
// ------------------------------------------------------------

std::vector<BookStat> Aggregator::BookBreakdown(const std::string& reader_id, const util::DateRange& range) {
  ValidateRange(range);

  std::unordered_map<std::string, BookStat>             stats;
  std::unordered_map<std::string, std::set<util::Date>> days;
  for (const auto& e : ReadLedger({.reader_id = reader_id, .from = range.from, .to = range.to})) {
    auto& stat   = stats[e.book_id];
    stat.book_id = e.book_id;
    stat.pages += e.pages_equivalent;
    stat.audio_seconds += e.audio_seconds;
    days[e.book_id].insert(e.log_date);
  }

  std::vector<BookStat> out;
  for (auto& [book_id, stat] : stats) {
    stat.reading_days = static_cast<int>(days[book_id].size());
    out.push_back(std::move(stat));
  }
  std::sort(out.begin(), out.end(), [](const BookStat& a, const BookStat& b) {
    if (a.pages != b.pages) return b.pages < a.pages;
    return a.book_id < b.book_id;
  });
  return out;
}

std::vector<LeaderboardEntry> Aggregator::Leaderboard(const util::DateRange& range, std::size_t limit) {
  ValidateRange(range);

  std::unordered_map<std::string, util::Decimal>        pages;
  std::unordered_map<std::string, std::set<util::Date>> days;
  for (const auto& e : ReadLedger({.from = range.from, .to = range.to})) {
    pages[e.reader_id] += e.pages_equivalent;
    days[e.reader_id].insert(e.log_date);
  }

  std::vector<LeaderboardEntry> out;
  for (const auto& [reader_id, total] : pages) {
    if (!(util::Decimal{} < total)) continue;
    out.push_back({0, reader_id, total, static_cast<int>(days[reader_id].size())});
  }
  std::sort(out.begin(), out.end(), [](const LeaderboardEntry& a, const LeaderboardEntry& b) {
    if (a.pages != b.pages) return b.pages < a.pages;
    return a.reader_id < b.reader_id;
  });
  if (out.size() > limit) out.resize(limit);
  for (std::size_t i = 0; i < out.size(); ++i) out[i].rank = static_cast<int>(i) + 1;
  return out;
}

// ------------------------------------------------------------
// Forecast
// ------------------------------------------------------------

Forecast Aggregator::BuildForecast(db::Transaction& tx, const model::ProgressRecord& record) {
  Forecast forecast;
  forecast.progress_id = record.id;

  std::optional<std::int64_t> catalog_pages;
  if (catalog_) catalog_pages = catalog_->GetEffectiveTotalPages(record.key.book_id);
  const auto reference = equivalence::Converter::ReferencePages(record, catalog_pages);

  if (record.state == model::ProgressState::kComplete) {
    forecast.pages_left = 0;
  } else if (reference) {
    forecast.pages_left = std::max<std::int64_t>(*reference - record.current_page.value_or(0), 0);
  }

  util::Decimal        total;
  std::set<util::Date> reading_days;
  for (const auto& e : repository_->ReadLedger(tx, {.progress_id = record.id})) {
    total += e.pages_equivalent;
    if (util::Decimal{} < e.pages_equivalent) reading_days.insert(e.log_date);
  }
  forecast.reading_days = static_cast<int>(reading_days.size());
  if (forecast.reading_days > 0) forecast.average_pages_per_day = Average(total, forecast.reading_days);

  if (forecast.pages_left && *forecast.pages_left == 0) {
    forecast.days_remaining = 0;
  } else if (forecast.pages_left && forecast.average_pages_per_day && !forecast.average_pages_per_day->IsZero()) {
    const auto days         = util::CeilDiv(*forecast.pages_left * util::Decimal::kScale, forecast.average_pages_per_day->Units());
    forecast.days_remaining = std::max<std::int64_t>(days, 1);
  }
  return forecast;
}

Forecast Aggregator::ForecastFor(std::uint64_t progress_id) {
  return ReadOnly(*repository_, "forecast", [&](db::Transaction& tx) {
    auto record = repository_->GetProgressById(tx, progress_id);
    if (!record) throw util::NotFound("no progress record with id " + std::to_string(progress_id));
    return BuildForecast(tx, *record);
  });
}

Forecast Aggregator::ForecastFor(const model::ProgressKey& key) {
  return ReadOnly(*repository_, "forecast", [&](db::Transaction& tx) {
    auto record = repository_->GetProgress(tx, key);
    if (!record) throw util::NotFound("no progress record for " + key.ToString());
    return BuildForecast(tx, *record);
  });
}

} // namespace pagewise::stats
