#pragma once

#include <atomic>
#include <map>
#include <mutex>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace pagewise::db::memory {

class MemoryTransaction;

// Unambiguous map key for (reader, book, context).
std::string StorageKey(const model::ProgressKey& key);

class MemoryRepository final : public db::Repository {
public:
  MemoryRepository();

  std::unique_ptr<Transaction> Begin() override;

  Result InsertProgress(Transaction&, model::ProgressRecord&) override;
  std::optional<model::ProgressRecord> GetProgress(Transaction&, const model::ProgressKey&) override;
  std::optional<model::ProgressRecord> GetProgressById(Transaction&, std::uint64_t) override;
  std::vector<model::ProgressRecord> ListProgress(Transaction&, const std::string&) override;
  Result UpdateProgress(Transaction&, model::ProgressRecord&) override;

  Result UpsertMedium(Transaction&, const model::MediumState&) override;
  std::vector<model::MediumState> ListMedia(Transaction&, std::uint64_t) override;
  Result DeleteMedium(Transaction&, std::uint64_t, model::Medium) override;

  Result AppendLedgerEntries(Transaction&, std::vector<model::LedgerEntry>&) override;
  std::vector<model::LedgerEntry> ReadLedger(Transaction&, const LedgerQuery&) override;

  Result InsertCompletion(Transaction&, const model::CompletionRecord&) override;
  std::vector<model::CompletionRecord> ListCompletions(Transaction&, const CompletionQuery&) override;

private:
  friend class MemoryTransaction;

  struct State {
    std::map<std::uint64_t, model::ProgressRecord>           progress;
    std::map<std::string, std::uint64_t>                     progress_by_key;
    std::map<std::uint64_t, std::vector<model::MediumState>> media;
    std::vector<model::LedgerEntry>                          ledger;
    std::vector<model::CompletionRecord>                     completions;
    std::uint64_t                                            next_ledger_id = 1;
  };

  std::mutex mutex_;
  State      committed_;

  // Progress ids are handed out at insert time so that concurrent
  // transactions never collide on them.
  std::atomic<std::uint64_t> next_progress_id_{1};
};

} // namespace pagewise::db::memory
