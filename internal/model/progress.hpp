#pragma once

#include <algorithm>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "internal/model/medium.hpp"
#include "internal/model/state_machine.hpp"
#include "internal/util/decimal.hpp"
#include "internal/util/time.hpp"

namespace pagewise::model {

inline constexpr util::Decimal kMinPlaybackSpeed     = util::Decimal::FromUnits(5000);
inline constexpr util::Decimal kMaxPlaybackSpeed     = util::Decimal::FromUnits(30000);
inline constexpr util::Decimal kDefaultPlaybackSpeed = util::Decimal::FromInteger(1);
inline constexpr util::Decimal kFullPercent          = util::Decimal::FromInteger(100);

// One read-through of one book by one reader. An empty context id is the
// reader's default read-through.
struct ProgressKey {
  std::string reader_id;
  std::string book_id;
  std::string context_id;

  bool operator==(const ProgressKey&) const = default;

  std::string ToString() const {
    return context_id.empty() ? reader_id + "/" + book_id : reader_id + "/" + book_id + "#" + context_id;
  }
};

/*
  Per-format position.

  Page media use current_page / total_pages_override, audio uses the
  position / length pair expressed in book time (already speed adjusted).
*/
struct MediumState {
  std::uint64_t progress_id = 0;
  Medium        medium      = Medium::kPaper;

  std::int64_t                current_page = 0;
  std::optional<std::int64_t> total_pages_override;

  std::int64_t                 position_seconds = 0;
  std::optional<std::int64_t>  length_seconds;
  std::optional<util::Decimal> playback_speed;

  std::int64_t RawValue() const {
    return IsPageBased(medium) ? current_page : position_seconds;
  }

  void SetRawValue(std::int64_t value) {
    if (IsPageBased(medium)) {
      current_page = value;
    } else {
      position_seconds = value;
    }
  }
};

struct ProgressRecord {
  std::uint64_t id = 0;
  ProgressKey   key;

  util::Decimal               percent;
  std::vector<Medium>         active_formats;
  std::optional<std::int64_t> custom_total_pages;
  util::Decimal               playback_speed = kDefaultPlaybackSpeed;
  std::optional<std::int64_t> current_page;

  ProgressState                  state = ProgressState::kInProgress;
  std::optional<util::TimePoint> completed_at;

  util::TimePoint created_at{};
  util::TimePoint updated_at{};

  // Incremented by the repository on every committed update.
  std::uint64_t version = 0;

  bool IsActive(Medium medium) const {
    return std::find(active_formats.begin(), active_formats.end(), medium) != active_formats.end();
  }
};

inline MediumState* FindMedium(std::vector<MediumState>& media, Medium medium) {
  auto it = std::find_if(media.begin(), media.end(), [medium](const MediumState& m) { return m.medium == medium; });
  return it == media.end() ? nullptr : &*it;
}

inline const MediumState* FindMedium(const std::vector<MediumState>& media, Medium medium) {
  auto it = std::find_if(media.begin(), media.end(), [medium](const MediumState& m) { return m.medium == medium; });
  return it == media.end() ? nullptr : &*it;
}

} // namespace pagewise::model
