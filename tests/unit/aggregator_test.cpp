#include "internal/stats/aggregator.hpp"

#include <cassert>
#include <functional>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "internal/catalog/memory_catalog.hpp"
#include "internal/core/progress_engine.hpp"
#include "internal/db/memory/memory_repository.hpp"

namespace {

using pagewise::core::MediumSettings;
using pagewise::model::Medium;
using pagewise::model::ProgressKey;
using pagewise::stats::Period;
using pagewise::util::Decimal;
using pagewise::util::MakeDate;

// March 2024 starts on a Friday.
pagewise::util::Date Day(unsigned day) {
  return MakeDate(2024, 3, day);
}

pagewise::util::TimePoint At(unsigned day) {
  return pagewise::util::AtLocalNoon(Day(day), std::chrono::minutes(0));
}

struct Harness {
  std::shared_ptr<pagewise::db::memory::MemoryRepository> repository = std::make_shared<pagewise::db::memory::MemoryRepository>();
  std::shared_ptr<pagewise::catalog::MemoryCatalog>       catalog    = std::make_shared<pagewise::catalog::MemoryCatalog>();
  pagewise::core::ProgressEngine                          engine{repository, catalog, nullptr};
  pagewise::stats::Aggregator                             aggregator{repository, catalog};

  Harness() {
    catalog->Put("dune", 300);
    catalog->Put("emma", 200);
  }

  // ana: dune on the 1st, 2nd, 3rd and 6th; emma by audio on the 3rd; finishes dune on the 10th.
  void SeedAna() {
    const ProgressKey dune{"ana", "dune", ""};
    engine.ReportProgress(dune, Medium::kPaper, 20, At(1));
    engine.ReportProgress(dune, Medium::kPaper, 50, At(2));
    engine.ReportProgress(dune, Medium::kPaper, 90, At(3));
    engine.ReportProgress(dune, Medium::kPaper, 130, At(6));

    const ProgressKey emma{"ana", "emma", ""};
    MediumSettings    audio;
    audio.length_seconds = 20000;
    engine.ActivateFormat(emma, Medium::kAudio, audio, At(3));
    engine.ReportProgress(emma, Medium::kAudio, 5000, At(3)); // 50 pages
  }
};

// Forwards to a MemoryRepository and runs `after_ledger_read` once, right
// after the first ledger read, while the reading transaction is still open.
class InterleavingRepository final : public pagewise::db::Repository {
 public:
  std::function<void()> after_ledger_read;

  std::unique_ptr<pagewise::db::Transaction> Begin() override {
    return inner_.Begin();
  }
  pagewise::db::Result InsertProgress(pagewise::db::Transaction& tx, pagewise::model::ProgressRecord& r) override {
    return inner_.InsertProgress(tx, r);
  }
  std::optional<pagewise::model::ProgressRecord> GetProgress(pagewise::db::Transaction& tx, const ProgressKey& key) override {
    return inner_.GetProgress(tx, key);
  }
  std::optional<pagewise::model::ProgressRecord> GetProgressById(pagewise::db::Transaction& tx, std::uint64_t id) override {
    return inner_.GetProgressById(tx, id);
  }
  std::vector<pagewise::model::ProgressRecord> ListProgress(pagewise::db::Transaction& tx, const std::string& reader_id) override {
    return inner_.ListProgress(tx, reader_id);
  }
  pagewise::db::Result UpdateProgress(pagewise::db::Transaction& tx, pagewise::model::ProgressRecord& r) override {
    return inner_.UpdateProgress(tx, r);
  }
  pagewise::db::Result UpsertMedium(pagewise::db::Transaction& tx, const pagewise::model::MediumState& m) override {
    return inner_.UpsertMedium(tx, m);
  }
  std::vector<pagewise::model::MediumState> ListMedia(pagewise::db::Transaction& tx, std::uint64_t id) override {
    return inner_.ListMedia(tx, id);
  }
  pagewise::db::Result DeleteMedium(pagewise::db::Transaction& tx, std::uint64_t id, Medium medium) override {
    return inner_.DeleteMedium(tx, id, medium);
  }
  pagewise::db::Result AppendLedgerEntries(pagewise::db::Transaction& tx, std::vector<pagewise::model::LedgerEntry>& entries) override {
    return inner_.AppendLedgerEntries(tx, entries);
  }
  std::vector<pagewise::model::LedgerEntry> ReadLedger(pagewise::db::Transaction& tx, const pagewise::db::LedgerQuery& q) override {
    auto rows = inner_.ReadLedger(tx, q);
    if (after_ledger_read) {
      auto hook = std::move(after_ledger_read);
      after_ledger_read = nullptr;
      hook();
    }
    return rows;
  }
  pagewise::db::Result InsertCompletion(pagewise::db::Transaction& tx, const pagewise::model::CompletionRecord& r) override {
    return inner_.InsertCompletion(tx, r);
  }
  std::vector<pagewise::model::CompletionRecord> ListCompletions(pagewise::db::Transaction& tx,
                                                                 const pagewise::db::CompletionQuery& q) override {
    return inner_.ListCompletions(tx, q);
  }

 private:
  pagewise::db::memory::MemoryRepository inner_;
};

void TestDailyTotalsIncludeIdleDays() {
  Harness h;
  h.SeedAna();

  const auto days = h.aggregator.DailyTotals("ana", {Day(1), Day(7)});
  assert(days.size() == 7);
  assert(days[0].pages == Decimal::FromInteger(20));
  assert(days[1].pages == Decimal::FromInteger(30));
  assert(days[2].pages == Decimal::FromInteger(90));
  assert(days[2].audio_seconds == 5000);
  assert(days[2].pages_by_medium.at(Medium::kPaper) == Decimal::FromInteger(40));
  assert(days[2].pages_by_medium.at(Medium::kAudio) == Decimal::FromInteger(50));
  assert((days[2].books == std::vector<std::string>{"dune", "emma"}));
  assert(!days[3].HasActivity());
  assert(days[5].pages == Decimal::FromInteger(40));

  assert(h.aggregator.DailyTotals("nobody", {Day(1), Day(2)})[0].pages == Decimal{});

  bool threw = false;
  try {
    h.aggregator.DailyTotals("ana", {Day(5), Day(1)});
  } catch (const pagewise::util::InvalidRawValue&) {
    threw = true;
  }
  assert(threw);
}

void TestSummaryOverRange() {
  Harness h;
  h.SeedAna();
  h.engine.MarkFinished({"ana", "dune", ""}, At(10));

  const auto summary = h.aggregator.Summary("ana", Period::kMonth, Day(15));
  assert(summary.range.from == Day(1));
  assert(summary.range.to == Day(31));
  // dune: 300 pages in total, emma: 50 via audio.
  assert(summary.total_pages == Decimal::FromInteger(350));
  assert(summary.reading_days == 5);
  assert(*summary.average_pages_per_day == Decimal::FromInteger(70));
  assert(summary.best_day->date == Day(10));
  assert(summary.best_day->pages == Decimal::FromInteger(170));
  assert(summary.audio_seconds == 5000);
  assert(summary.books_completed == 1);
  assert(summary.share_percent.at(Medium::kAudio) == Decimal::Parse("14.29"));
  assert(summary.share_percent.at(Medium::kPaper) == Decimal::Parse("85.71"));

  const auto week = h.aggregator.Summary("ana", Period::kWeek, Day(7));
  assert(week.range.from == Day(1));
  assert(week.total_pages == Decimal::FromInteger(180));
  assert(week.books_completed == 0);

  const auto quiet = h.aggregator.Summary("ana", {Day(20), Day(25)});
  assert(quiet.reading_days == 0);
  assert(!quiet.average_pages_per_day);
  assert(!quiet.best_day);
  assert(quiet.share_percent.empty());
}

void TestSummaryAndCalendarSeeOneConsistentState() {
  auto repository = std::make_shared<InterleavingRepository>();
  auto catalog    = std::make_shared<pagewise::catalog::MemoryCatalog>();
  catalog->Put("dune", 300);
  pagewise::core::ProgressEngine engine{repository, catalog, nullptr};
  pagewise::stats::Aggregator    aggregator{repository, catalog};

  const ProgressKey dune{"ana", "dune", ""};
  engine.ReportProgress(dune, Medium::kPaper, 120, At(1));

  // A finish commits between the ledger read and the completion read.
  repository->after_ledger_read = [&] { engine.MarkFinished(dune, At(2)); };
  const auto during = aggregator.Summary("ana", Period::kMonth, Day(1));
  assert(during.total_pages == Decimal::FromInteger(120));
  assert(during.books_completed == 0);

  const auto after = aggregator.Summary("ana", Period::kMonth, Day(1));
  assert(after.total_pages == Decimal::FromInteger(300));
  assert(after.books_completed == 1);

  catalog->Put("emma", 50);
  engine.ReportProgress({"ana", "emma", ""}, Medium::kPaper, 10, At(3));
  repository->after_ledger_read = [&] { engine.MarkFinished({"ana", "emma", ""}, At(3)); };
  const auto calendar = aggregator.Calendar("ana", 2024, 3);
  assert(calendar.days[2].pages == Decimal::FromInteger(10));
  assert(!calendar.days[2].completed);

  const auto settled = aggregator.Calendar("ana", 2024, 3);
  assert(settled.days[2].pages == Decimal::FromInteger(50));
  assert(settled.days[2].completed);
}

void TestPeriodRanges() {
  using pagewise::stats::PeriodRange;
  assert(PeriodRange(Period::kDay, Day(9)).from == Day(9));
  assert(PeriodRange(Period::kWeek, Day(9)).from == Day(3));
  assert(PeriodRange(Period::kMonth, MakeDate(2024, 2, 10)).to == MakeDate(2024, 2, 29));
  assert(PeriodRange(Period::kYear, Day(9)).from == MakeDate(2024, 1, 1));
  assert(PeriodRange(Period::kYear, Day(9)).to == MakeDate(2024, 12, 31));
}

void TestCalendarGrid() {
  Harness h;
  h.SeedAna();
  h.engine.MarkFinished({"ana", "dune", ""}, At(10));

  const auto calendar = h.aggregator.Calendar("ana", 2024, 3);
  assert(calendar.days.size() == 31);
  assert(calendar.has_activity);
  assert(calendar.previous_month == MakeDate(2024, 2, 1));
  assert(calendar.next_month == MakeDate(2024, 4, 1));

  // Monday-first: Feb 26..Mar 31 spans five weeks, March 1st sits in column 4.
  assert(calendar.weeks.size() == 5);
  assert(!calendar.weeks[0][0].in_month);
  assert(calendar.weeks[0][0].date == MakeDate(2024, 2, 26));
  assert(calendar.weeks[0][4].date == Day(1));
  assert(calendar.weeks[0][4].pages == Decimal::FromInteger(20));
  assert(calendar.weeks[4][6].date == Day(31));

  const auto& third = calendar.days[2];
  assert(third.audio_minutes == 84);
  assert(third.books.size() == 2);

  const auto& tenth = calendar.days[9];
  assert(tenth.completed);
  assert(tenth.completed_books == std::vector<std::string>{"dune"});

  const auto empty = h.aggregator.Calendar("ana", 2024, 4);
  assert(!empty.has_activity);
  assert(empty.previous_month == MakeDate(2024, 3, 1));

  bool threw = false;
  try {
    h.aggregator.Calendar("ana", 2024, 13);
  } catch (const pagewise::util::InvalidRawValue&) {
    threw = true;
  }
  assert(threw);
}

void TestStreaks() {
  Harness h;
  h.SeedAna();

  const auto streaks = h.aggregator.StreaksFor("ana", {Day(1), Day(7)});
  assert(streaks.longest_active->days == 3);
  assert(streaks.longest_active->from == Day(1));
  assert(streaks.longest_active->to == Day(3));
  assert(streaks.longest_idle->days == 2);
  assert(streaks.longest_idle->from == Day(4));
  assert(streaks.current == 0);

  const auto ending_active = h.aggregator.StreaksFor("ana", {Day(4), Day(6)});
  assert(ending_active.current == 1);
  assert(ending_active.longest_active->days == 1);

  const auto none = h.aggregator.StreaksFor("bo", {Day(1), Day(3)});
  assert(!none.longest_active);
  assert(none.longest_idle->days == 3);
}

void TestBookBreakdownAndLeaderboard() {
  Harness h;
  h.SeedAna();
  h.engine.ReportProgress({"bo", "emma", ""}, Medium::kPaper, 200, At(2));
  h.engine.ReportProgress({"cy", "dune", ""}, Medium::kPaper, 90, At(4));
  h.engine.ReportProgress({"dee", "dune", ""}, Medium::kPaper, 0, At(4));

  const auto books = h.aggregator.BookBreakdown("ana", {Day(1), Day(31)});
  assert(books.size() == 2);
  assert(books[0].book_id == "dune");
  assert(books[0].pages == Decimal::FromInteger(130));
  assert(books[0].reading_days == 4);
  assert(books[1].book_id == "emma");
  assert(books[1].audio_seconds == 5000);

  const auto board = h.aggregator.Leaderboard({Day(1), Day(31)}, 10);
  assert(board.size() == 3);
  assert(board[0].reader_id == "bo");
  assert(board[0].rank == 1);
  assert(board[1].reader_id == "ana");
  assert(board[1].pages == Decimal::FromInteger(180));
  assert(board[1].reading_days == 4);
  assert(board[2].reader_id == "cy");

  const auto top = h.aggregator.Leaderboard({Day(1), Day(31)}, 1);
  assert(top.size() == 1);
  assert(top[0].reader_id == "bo");
}

void TestForecast() {
  Harness h;
  h.SeedAna();

  // dune: 130 pages over 4 reading days, 170 left.
  auto forecast = h.aggregator.ForecastFor(ProgressKey{"ana", "dune", ""});
  assert(*forecast.pages_left == 170);
  assert(*forecast.average_pages_per_day == Decimal::Parse("32.50"));
  assert(forecast.reading_days == 4);
  assert(*forecast.days_remaining == 6);

  const auto by_id = h.aggregator.ForecastFor(forecast.progress_id);
  assert(by_id.days_remaining == forecast.days_remaining);

  h.engine.MarkFinished({"ana", "dune", ""}, At(8));
  forecast = h.aggregator.ForecastFor(ProgressKey{"ana", "dune", ""});
  assert(*forecast.pages_left == 0);
  assert(*forecast.days_remaining == 0);

  h.engine.ReportProgress({"ana", "unknown", ""}, Medium::kPaper, 40, At(8));
  const auto unknown = h.aggregator.ForecastFor(ProgressKey{"ana", "unknown", ""});
  assert(!unknown.pages_left);
  assert(!unknown.days_remaining);

  bool threw = false;
  try {
    h.aggregator.ForecastFor(ProgressKey{"ana", "missing", ""});
  } catch (const pagewise::util::NotFound&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestDailyTotalsIncludeIdleDays();
  TestSummaryOverRange();
  TestSummaryAndCalendarSeeOneConsistentState();
  TestPeriodRanges();
  TestCalendarGrid();
  TestStreaks();
  TestBookBreakdownAndLeaderboard();
  TestForecast();

  std::cout << "pagewise_unit_aggregator: pass\n";
  return 0;
}
