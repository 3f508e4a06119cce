#include "converter.hpp"

#include <algorithm>

namespace pagewise::equivalence {

std::optional<std::int64_t> Converter::ReferencePages(const model::ProgressRecord& record, std::optional<std::int64_t> catalog_pages) {
  if (record.custom_total_pages && *record.custom_total_pages > 0) return record.custom_total_pages;
  if (catalog_pages && *catalog_pages > 0) return catalog_pages;
  return std::nullopt;
}

std::optional<std::int64_t> Converter::TotalForMedium(const model::MediumState& medium, std::optional<std::int64_t> reference_pages) {
  if (model::IsPageBased(medium.medium)) {
    if (medium.total_pages_override && *medium.total_pages_override > 0) return medium.total_pages_override;
    return reference_pages;
  }
  if (medium.length_seconds && *medium.length_seconds > 0) return medium.length_seconds;
  return std::nullopt;
}

std::optional<util::Decimal> Converter::ToPagesEquivalent(const model::MediumState& medium, std::int64_t raw_value,
                                                          std::optional<std::int64_t> reference_pages) {
  if (!reference_pages) return std::nullopt;

  if (model::IsPageBased(medium.medium)) {
    // A different edition: rescale its page onto the reference edition.
    if (medium.total_pages_override && *medium.total_pages_override > 0 && *medium.total_pages_override != *reference_pages) {
      return util::Decimal::FromRatio(*reference_pages * raw_value, *medium.total_pages_override, kPlaces);
    }
    return util::Decimal::FromInteger(raw_value);
  }

  if (!medium.length_seconds || *medium.length_seconds <= 0) return std::nullopt;
  return util::Decimal::FromRatio(*reference_pages * raw_value, *medium.length_seconds, kPlaces);
}

util::Decimal Converter::PercentOf(std::int64_t raw_value, std::int64_t total) {
  const auto percent = util::Decimal::FromRatio(std::max<std::int64_t>(raw_value, 0) * 100, total, kPlaces);
  return util::Min(percent, model::kFullPercent);
}

std::int64_t Converter::RawForPercent(std::int64_t total, util::Decimal percent) {
  const auto raw = util::MulDivRoundHalfUp(total, percent.Units(), 100 * util::Decimal::kScale);
  return std::clamp<std::int64_t>(raw, 0, total);
}

std::int64_t Converter::AdjustForSpeed(std::int64_t listened_seconds, util::Decimal speed) {
  return util::MulDivRoundHalfUp(listened_seconds, speed.Units(), util::Decimal::kScale);
}

std::int64_t Converter::ListenedSeconds(std::int64_t book_seconds, util::Decimal speed) {
  return util::MulDivRoundHalfUp(book_seconds, util::Decimal::kScale, speed.Units());
}

util::Decimal Converter::EffectiveSpeed(const model::ProgressRecord& record, const model::MediumState& medium) {
  if (medium.playback_speed) return *medium.playback_speed;
  return record.playback_speed;
}

} // namespace pagewise::equivalence
