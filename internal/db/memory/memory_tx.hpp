#pragma once

#include <cstdint>
#include <map>
#include <vector>

#include "internal/db/api/transaction.hpp"
#include "memory_repository.hpp"

namespace pagewise::db::memory {

/*
  Transaction = snapshot + write set

  Reads and writes go to a private copy of the committed state. Commit merges
  only what this transaction touched: dirty progress records (with their
  media) and appended ledger / completion rows. A dirty record whose committed
  version moved since the snapshot is a conflict and the commit throws.
*/

class MemoryTransaction final : public db::Transaction {
 public:
  explicit MemoryTransaction(MemoryRepository& repo);
  ~MemoryTransaction();

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override {
    return committed_;
  }

  MemoryRepository::State& Mutable() {
    return working_;
  }
  const MemoryRepository::State& View() const {
    return working_;
  }

  // Must be called before the first write to a progress record or its media.
  void MarkDirty(std::uint64_t progress_id);

  void StageLedger(const model::LedgerEntry& entry);
  void StageCompletion(const model::CompletionRecord& record);

 private:
  MemoryRepository&       repo_;
  MemoryRepository::State working_;
  bool                    committed_   = false;
  bool                    rolled_back_ = false;

  std::map<std::uint64_t, std::uint64_t> base_versions_;
  std::vector<model::LedgerEntry>        staged_ledger_;
  std::vector<model::CompletionRecord>   staged_completions_;
};

} // namespace pagewise::db::memory
