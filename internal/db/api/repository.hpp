#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/model/ledger.hpp"
#include "internal/model/progress.hpp"

namespace pagewise::db {

struct LedgerQuery {
  std::optional<std::string>   reader_id;
  std::optional<std::uint64_t> progress_id;
  std::optional<util::Date>    from;
  std::optional<util::Date>    to;
};

struct CompletionQuery {
  std::optional<std::string> reader_id;
  std::optional<util::Date>  from;
  std::optional<util::Date>  to;
};

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All writes require a Transaction
  - Reads inside a transaction see its writes
  - One medium row per (progress, medium); one progress row per key
  - Ledger rows are insert-only; there is no update or delete call
  - Version increments on UpdateProgress are atomic with the commit

  The DB is the source of truth for:
    progress records and media positions
    the reading ledger
    completions
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Progress records
  // ---------------------------------------------------------------------

  // Assigns record.id. AlreadyExists when the key is taken.
  virtual Result InsertProgress(Transaction&, model::ProgressRecord& record) = 0;

  virtual std::optional<model::ProgressRecord> GetProgress(Transaction&, const model::ProgressKey& key) = 0;

  virtual std::optional<model::ProgressRecord> GetProgressById(Transaction&, std::uint64_t id) = 0;

  virtual std::vector<model::ProgressRecord> ListProgress(Transaction&, const std::string& reader_id) = 0;

  // Stores the record and bumps record.version.
  virtual Result UpdateProgress(Transaction&, model::ProgressRecord& record) = 0;

  // ---------------------------------------------------------------------
  // Medium states
  // ---------------------------------------------------------------------

  virtual Result UpsertMedium(Transaction&, const model::MediumState& medium) = 0;

  virtual std::vector<model::MediumState> ListMedia(Transaction&, std::uint64_t progress_id) = 0;

  virtual Result DeleteMedium(Transaction&, std::uint64_t progress_id, model::Medium medium) = 0;

  // ---------------------------------------------------------------------
  // Reading ledger (append-only)
  // ---------------------------------------------------------------------

  // Rejects negative pages_equivalent / audio_seconds with ConstraintViolation.
  virtual Result AppendLedgerEntries(Transaction&, std::vector<model::LedgerEntry>& entries) = 0;

  // Ordered by (log_date, entry_id). Range bounds are inclusive.
  virtual std::vector<model::LedgerEntry> ReadLedger(Transaction&, const LedgerQuery& query) = 0;

  // ---------------------------------------------------------------------
  // Completions
  // ---------------------------------------------------------------------

  virtual Result InsertCompletion(Transaction&, const model::CompletionRecord& record) = 0;

  // Ordered by completed_at.
  virtual std::vector<model::CompletionRecord> ListCompletions(Transaction&, const CompletionQuery& query) = 0;
};

} // namespace pagewise::db
