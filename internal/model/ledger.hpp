#pragma once

#include <cstdint>
#include <string>

#include "internal/model/medium.hpp"
#include "internal/util/decimal.hpp"
#include "internal/util/time.hpp"

namespace pagewise::model {

/*
  Reading ledger row.

  IMPORTANT:
  - Rows are deltas, not snapshots. Several rows may share
    (progress_id, log_date, medium) and are summed on read.
  - Once committed a row is never updated or deleted.
  - reader_id / book_id are copied from the owning progress record so that
    read-side queries do not need to join.
*/
struct LedgerEntry {
  std::uint64_t entry_id    = 0; // assigned by the repository on commit
  std::uint64_t progress_id = 0;
  std::string   reader_id;
  std::string   book_id;

  util::Date    log_date{};
  Medium        medium = Medium::kPaper;
  util::Decimal pages_equivalent;
  std::int64_t  audio_seconds = 0;

  util::TimePoint recorded_at{};
};

// A finished read-through, dated in the reader's local calendar.
struct CompletionRecord {
  std::string   reader_id;
  std::string   book_id;
  std::uint64_t progress_id = 0;

  util::Date      completed_on{};
  util::TimePoint completed_at{};
};

} // namespace pagewise::model
