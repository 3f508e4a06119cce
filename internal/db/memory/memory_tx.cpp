#include "memory_tx.hpp"

#include <stdexcept>

namespace pagewise::db::memory {

MemoryTransaction::MemoryTransaction(MemoryRepository& repo) : repo_(repo) {
  std::scoped_lock lock(repo_.mutex_);
  working_ = repo_.committed_; // snapshot copy
}

MemoryTransaction::~MemoryTransaction() {
  if (!committed_ && !rolled_back_) Rollback();
}

void MemoryTransaction::MarkDirty(std::uint64_t progress_id) {
  const auto it = working_.progress.find(progress_id);
  base_versions_.try_emplace(progress_id, it == working_.progress.end() ? 0 : it->second.version);
}

void MemoryTransaction::StageLedger(const model::LedgerEntry& entry) {
  staged_ledger_.push_back(entry);
  working_.ledger.push_back(entry);
}

void MemoryTransaction::StageCompletion(const model::CompletionRecord& record) {
  staged_completions_.push_back(record);
  working_.completions.push_back(record);
}

void MemoryTransaction::Commit() {
  if (committed_ || rolled_back_) {
    throw std::runtime_error("transaction already finished");
  }

  std::scoped_lock lock(repo_.mutex_);
  auto&            committed = repo_.committed_;

  for (const auto& [id, base_version] : base_versions_) {
    const auto     it      = committed.progress.find(id);
    const uint64_t current = it == committed.progress.end() ? 0 : it->second.version;
    if (current != base_version) {
      throw std::runtime_error("transaction conflict: progress record was modified by a concurrent transaction");
    }

    const auto working_it = working_.progress.find(id);
    if (working_it != working_.progress.end()) {
      const auto key_it = committed.progress_by_key.find(StorageKey(working_it->second.key));
      if (key_it != committed.progress_by_key.end() && key_it->second != id) {
        throw std::runtime_error("transaction conflict: progress key was inserted by a concurrent transaction");
      }
    }
  }

  for (const auto& [id, _] : base_versions_) {
    const auto working_it = working_.progress.find(id);
    if (working_it == working_.progress.end()) continue;

    committed.progress[id]                                      = working_it->second;
    committed.progress_by_key[StorageKey(working_it->second.key)] = id;

    const auto media_it = working_.media.find(id);
    if (media_it == working_.media.end()) {
      committed.media.erase(id);
    } else {
      committed.media[id] = media_it->second;
    }
  }

  for (auto entry : staged_ledger_) {
    entry.entry_id = committed.next_ledger_id++;
    committed.ledger.push_back(std::move(entry));
  }
  for (auto& completion : staged_completions_) {
    committed.completions.push_back(std::move(completion));
  }

  committed_ = true;
}

void MemoryTransaction::Rollback() {
  rolled_back_ = true;
}

} // namespace pagewise::db::memory
