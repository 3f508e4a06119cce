#pragma once

#include <cstdint>
#include <optional>
#include <vector>

#include "internal/model/progress.hpp"
#include "internal/util/errors.hpp"

namespace pagewise::model {

struct MediumSnapshot {
  Medium                       medium = Medium::kPaper;
  std::int64_t                 raw_value = 0;
  std::optional<std::int64_t>  total;
  std::optional<util::Decimal> percent;
  std::optional<util::Decimal> pages_equivalent;
  std::optional<util::Decimal> playback_speed; // audio only, effective value
};

// Read model handed back to callers after every engine operation.
struct ProgressSnapshot {
  std::uint64_t progress_id = 0;
  ProgressKey   key;
  ProgressState state = ProgressState::kUnstarted;

  util::Decimal               percent;
  std::optional<std::int64_t> current_page;
  std::optional<std::int64_t> total_pages;
  std::optional<std::int64_t> pages_left;
  std::optional<std::int64_t> custom_total_pages;
  util::Decimal               playback_speed = kDefaultPlaybackSpeed;

  std::vector<Medium>         active_formats;
  std::vector<MediumSnapshot> media;

  std::optional<util::TimePoint> completed_at;
  util::TimePoint                updated_at{};

  // Page equivalents appended to the ledger by the call that produced this
  // snapshot; zero for reads.
  util::Decimal ledger_delta;

  std::optional<util::Reason> notice;
};

} // namespace pagewise::model
