#include <cassert>
#include <functional>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/catalog/memory_catalog.hpp"
#include "internal/core/progress_engine.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/events/event_bus.hpp"
#include "internal/stats/aggregator.hpp"

namespace {

using pagewise::db::ErrorCode;
using pagewise::db::Repository;
using pagewise::db::Result;
using pagewise::db::Transaction;
using pagewise::db::memory::MemoryRepository;
using pagewise::model::Medium;
using pagewise::model::ProgressKey;
using pagewise::util::Decimal;

enum class Fault {
  kNone,
  kLedgerRejected,
  kLedgerThrows,
  kCompletionRejected,
  kCommitThrows,
};

class CommitFailingTransaction final : public Transaction {
 public:
  explicit CommitFailingTransaction(std::unique_ptr<Transaction> inner) : inner_(std::move(inner)) {
  }

  void Commit() override {
    throw std::runtime_error("disk full");
  }
  void Rollback() override {
    inner_->Rollback();
  }
  bool IsCommitted() const override {
    return false;
  }

  Transaction& Inner() {
    return *inner_;
  }

 private:
  std::unique_ptr<Transaction> inner_;
};

// Delegates to a MemoryRepository and injects one failure on demand.
class FaultyRepository final : public Repository {
 public:
  Fault fault = Fault::kNone;

  std::unique_ptr<Transaction> Begin() override {
    auto tx = inner_.Begin();
    if (fault == Fault::kCommitThrows) return std::make_unique<CommitFailingTransaction>(std::move(tx));
    return tx;
  }

  Result InsertProgress(Transaction& tx, pagewise::model::ProgressRecord& r) override {
    return inner_.InsertProgress(Unwrap(tx), r);
  }
  std::optional<pagewise::model::ProgressRecord> GetProgress(Transaction& tx, const ProgressKey& key) override {
    return inner_.GetProgress(Unwrap(tx), key);
  }
  std::optional<pagewise::model::ProgressRecord> GetProgressById(Transaction& tx, std::uint64_t id) override {
    return inner_.GetProgressById(Unwrap(tx), id);
  }
  std::vector<pagewise::model::ProgressRecord> ListProgress(Transaction& tx, const std::string& reader_id) override {
    return inner_.ListProgress(Unwrap(tx), reader_id);
  }
  Result UpdateProgress(Transaction& tx, pagewise::model::ProgressRecord& r) override {
    return inner_.UpdateProgress(Unwrap(tx), r);
  }
  Result UpsertMedium(Transaction& tx, const pagewise::model::MediumState& m) override {
    return inner_.UpsertMedium(Unwrap(tx), m);
  }
  std::vector<pagewise::model::MediumState> ListMedia(Transaction& tx, std::uint64_t id) override {
    return inner_.ListMedia(Unwrap(tx), id);
  }
  Result DeleteMedium(Transaction& tx, std::uint64_t id, Medium medium) override {
    return inner_.DeleteMedium(Unwrap(tx), id, medium);
  }
  Result AppendLedgerEntries(Transaction& tx, std::vector<pagewise::model::LedgerEntry>& entries) override {
    if (fault == Fault::kLedgerRejected) return Result::Err(ErrorCode::IOError, "ledger unavailable");
    if (fault == Fault::kLedgerThrows) throw std::runtime_error("ledger socket closed");
    return inner_.AppendLedgerEntries(Unwrap(tx), entries);
  }
  std::vector<pagewise::model::LedgerEntry> ReadLedger(Transaction& tx, const pagewise::db::LedgerQuery& q) override {
    return inner_.ReadLedger(Unwrap(tx), q);
  }
  Result InsertCompletion(Transaction& tx, const pagewise::model::CompletionRecord& r) override {
    if (fault == Fault::kCompletionRejected) return Result::Err(ErrorCode::Busy, "database is locked");
    return inner_.InsertCompletion(Unwrap(tx), r);
  }
  std::vector<pagewise::model::CompletionRecord> ListCompletions(Transaction& tx, const pagewise::db::CompletionQuery& q) override {
    return inner_.ListCompletions(Unwrap(tx), q);
  }

 private:
  static Transaction& Unwrap(Transaction& tx) {
    if (auto* failing = dynamic_cast<CommitFailingTransaction*>(&tx)) return failing->Inner();
    return tx;
  }

  MemoryRepository inner_;
};

struct Harness {
  std::shared_ptr<FaultyRepository>                 repository = std::make_shared<FaultyRepository>();
  std::shared_ptr<pagewise::catalog::MemoryCatalog> catalog    = std::make_shared<pagewise::catalog::MemoryCatalog>();
  std::shared_ptr<pagewise::events::EventBus>       events     = std::make_shared<pagewise::events::EventBus>();
  pagewise::core::ProgressEngine                    engine{repository, catalog, events};
  pagewise::stats::Aggregator                       aggregator{repository, catalog};
  int                                               published = 0;

  Harness() {
    catalog->Put("dune", 300);
    events->Subscribe([this](const pagewise::events::Event&) { ++published; });
  }

  Decimal LedgerTotal() {
    Decimal total;
    for (const auto& day : aggregator.DailyTotals("ana", {Day(1), Day(30)})) total += day.pages;
    return total;
  }

  static pagewise::util::Date Day(unsigned day) {
    return pagewise::util::MakeDate(2024, 6, day);
  }
};

pagewise::util::TimePoint At(unsigned day) {
  return pagewise::util::AtLocalNoon(Harness::Day(day), std::chrono::minutes(0));
}

const ProgressKey kKey{"ana", "dune", ""};

void ExpectStorageFailure(const std::function<void()>& fn) {
  bool threw = false;
  try {
    fn();
  } catch (const pagewise::util::StorageFailure&) {
    threw = true;
  }
  assert(threw);
}

void TestRejectedLedgerRollsBackNewRecord() {
  Harness h;
  h.repository->fault = Fault::kLedgerRejected;

  ExpectStorageFailure([&] { h.engine.ReportProgress(kKey, Medium::kPaper, 40, At(1)); });
  h.repository->fault = Fault::kNone;

  assert(!h.engine.GetProgress(kKey));
  assert(h.LedgerTotal() == Decimal{});
  assert(h.published == 0);
}

void TestThrowingLedgerKeepsPreviousPosition() {
  Harness h;
  h.engine.ReportProgress(kKey, Medium::kPaper, 40, At(1));
  const int before = h.published;

  h.repository->fault = Fault::kLedgerThrows;
  ExpectStorageFailure([&] { h.engine.ReportProgress(kKey, Medium::kPaper, 90, At(2)); });
  h.repository->fault = Fault::kNone;

  auto snapshot = h.engine.GetProgress(kKey);
  assert(snapshot->media.front().raw_value == 40);
  assert(snapshot->percent == Decimal::Parse("13.33"));
  assert(h.LedgerTotal() == Decimal::FromInteger(40));
  assert(h.published == before);

  // The same report succeeds once storage recovers, counting the full step.
  auto retried = h.engine.ReportProgress(kKey, Medium::kPaper, 90, At(2));
  assert(retried.ledger_delta == Decimal::FromInteger(50));
}

void TestRejectedCompletionLeavesRecordOpen() {
  Harness h;
  h.engine.ReportProgress(kKey, Medium::kPaper, 100, At(1));

  h.repository->fault = Fault::kCompletionRejected;
  ExpectStorageFailure([&] { h.engine.MarkFinished(kKey, At(2)); });
  h.repository->fault = Fault::kNone;

  auto snapshot = h.engine.GetProgress(kKey);
  assert(snapshot->state == pagewise::model::ProgressState::kInProgress);
  assert(h.LedgerTotal() == Decimal::FromInteger(100));
  assert(h.aggregator.Summary("ana", {Harness::Day(1), Harness::Day(30)}).books_completed == 0);
}

void TestCommitFailureIsStorageFailure() {
  Harness h;
  h.engine.ReportProgress(kKey, Medium::kPaper, 10, At(1));

  h.repository->fault = Fault::kCommitThrows;
  ExpectStorageFailure([&] { h.engine.ReportProgress(kKey, Medium::kPaper, 20, At(1)); });
  ExpectStorageFailure([&] { h.engine.GetProgress(kKey); });
  ExpectStorageFailure([&] { h.aggregator.DailyTotals("ana", {Harness::Day(1), Harness::Day(2)}); });
  h.repository->fault = Fault::kNone;

  assert(h.engine.GetProgress(kKey)->media.front().raw_value == 10);
}

void TestValidationFailsBeforeStorage() {
  Harness h;
  h.repository->fault = Fault::kCommitThrows;

  bool threw = false;
  try {
    h.engine.ReportProgress(kKey, Medium::kPaper, -3, At(1));
  } catch (const pagewise::util::InvalidRawValue&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestRejectedLedgerRollsBackNewRecord();
  TestThrowingLedgerKeepsPreviousPosition();
  TestRejectedCompletionLeavesRecordOpen();
  TestCommitFailureIsStorageFailure();
  TestValidationFailsBeforeStorage();

  std::cout << "pagewise_unit_progress_engine_failures: pass\n";
  return 0;
}
