#pragma once

#include <cstdint>
#include <optional>

#include "internal/model/progress.hpp"
#include "internal/util/decimal.hpp"

namespace pagewise::equivalence {

/*
  Stateless conversions between raw medium positions, percentages and
  page-equivalents.

  Reference pages are the page count of the reference (paper) edition:
  the record's custom total when set, otherwise the catalog value.
  Page-equivalents and percentages are rounded half-up to 2 places.
*/
class Converter {
 public:
  static constexpr int kPlaces = 2;

  static std::optional<std::int64_t> ReferencePages(const model::ProgressRecord& record, std::optional<std::int64_t> catalog_pages);

  // Pages for PAPER/EBOOK (own override first), seconds for AUDIO.
  static std::optional<std::int64_t> TotalForMedium(const model::MediumState& medium, std::optional<std::int64_t> reference_pages);

  // nullopt when no equivalence can be resolved (unknown reference pages,
  // unknown audio length).
  static std::optional<util::Decimal> ToPagesEquivalent(const model::MediumState& medium, std::int64_t raw_value,
                                                        std::optional<std::int64_t> reference_pages);

  // raw * 100 / total, clamped to [0, 100]. total must be positive.
  static util::Decimal PercentOf(std::int64_t raw_value, std::int64_t total);

  // total * percent / 100 rounded half-up, clamped to [0, total].
  static std::int64_t RawForPercent(std::int64_t total, util::Decimal percent);

  // Book-time seconds covered by `listened_seconds` of wall-clock listening.
  static std::int64_t AdjustForSpeed(std::int64_t listened_seconds, util::Decimal speed);

  // Wall-clock seconds needed to cover `book_seconds` at `speed`.
  static std::int64_t ListenedSeconds(std::int64_t book_seconds, util::Decimal speed);

  static util::Decimal EffectiveSpeed(const model::ProgressRecord& record, const model::MediumState& medium);
};

} // namespace pagewise::equivalence
