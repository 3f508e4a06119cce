#pragma once

#include <cstdint>
#include <optional>
#include <vector>

#include "internal/model/ledger.hpp"
#include "internal/model/progress.hpp"
#include "internal/util/decimal.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace pagewise::core {

struct SyncContext {
  // Resolved reference pages (custom override > catalog).
  std::optional<std::int64_t> reference_pages;
  util::TimePoint             occurred_at{};
  // Reader-local date of occurred_at.
  util::Date log_date{};
};

struct SyncResult {
  model::ProgressRecord           record;
  std::vector<model::MediumState> media;
  // Media whose stored row must be rewritten.
  std::vector<model::Medium>      changed_media;
  std::vector<model::LedgerEntry> ledger;

  util::Decimal               previous_percent;
  util::Decimal               delta_equivalent;
  std::optional<util::Reason> notice;
};

/*
  Pure synchronization rules. No I/O, no locking.

  ApplyUpdate:
    - clamps the new raw value to the medium's total when known
    - the medium itself may move backwards; record percent never does
    - ledger delta = max(0, newEquivalent - previousEquivalent)
    - projects the new percent forward onto every other active medium
      with a known total (projection never writes ledger rows)

  Finish:
    - percent = 100, every medium with a known total moved to its end
    - one ledger delta filling the gap between the most advanced medium
      and the reference page count
*/
class Synchronizer {
 public:
  static SyncResult ApplyUpdate(const model::ProgressRecord& record, const std::vector<model::MediumState>& media, model::Medium medium,
                                std::int64_t raw_value, const SyncContext& ctx);

  static SyncResult Finish(const model::ProgressRecord& record, const std::vector<model::MediumState>& media, const SyncContext& ctx);

  // Moves `medium` forward to `percent` of its total. Returns true when the
  // position changed. Never moves backwards.
  static bool ProjectOnto(model::MediumState& medium, std::optional<std::int64_t> reference_pages, util::Decimal percent);

  static std::optional<std::int64_t> RepresentativePage(const model::ProgressRecord& record, const std::vector<model::MediumState>& media,
                                                        std::optional<std::int64_t> reference_pages);
};

} // namespace pagewise::core
