#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/stats/views.hpp"

namespace pagewise::catalog {
class BookCatalog;
}

namespace pagewise::stats {

util::DateRange PeriodRange(Period period, util::Date anchor);

/*
  Read-only queries over the reading ledger.

  Each call reads inside its own repository transaction, so a concurrent
  write is seen either entirely or not at all. Range bounds are inclusive;
  a range with from > to is rejected with InvalidRawValue.
*/
class Aggregator {
 public:
  Aggregator(std::shared_ptr<db::Repository> repository, std::shared_ptr<catalog::BookCatalog> catalog);

  // One entry per day of the range, zero days included.
  std::vector<DailyTotal> DailyTotals(const std::string& reader_id, const util::DateRange& range);

  PeriodSummary Summary(const std::string& reader_id, Period period, util::Date anchor);
  PeriodSummary Summary(const std::string& reader_id, const util::DateRange& range);

  CalendarMonth Calendar(const std::string& reader_id, int year, unsigned month);

  Streaks StreaksFor(const std::string& reader_id, const util::DateRange& range);

  // Sorted by pages descending, then book id.
  std::vector<BookStat> BookBreakdown(const std::string& reader_id, const util::DateRange& range);

  // Readers with any pages in the range, ranked by pages; ties by reader id.
  std::vector<LeaderboardEntry> Leaderboard(const util::DateRange& range, std::size_t limit);

  Forecast ForecastFor(std::uint64_t progress_id);
  Forecast ForecastFor(const model::ProgressKey& key);

 private:
  // Ledger rows and completions of one reader, read in the same transaction.
  struct Activity {
    std::vector<DailyTotal>              days;
    std::vector<model::CompletionRecord> completions;
  };

  std::vector<model::LedgerEntry> ReadLedger(const db::LedgerQuery& query);
  Activity                        ReadActivity(const std::string& reader_id, const util::DateRange& range);
  Forecast                        BuildForecast(db::Transaction& tx, const model::ProgressRecord& record);

  std::shared_ptr<db::Repository>       repository_;
  std::shared_ptr<catalog::BookCatalog> catalog_;
};

} // namespace pagewise::stats
