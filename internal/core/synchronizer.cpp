#include "synchronizer.hpp"

#include <algorithm>

#include "internal/equivalence/converter.hpp"

namespace pagewise::core {

using equivalence::Converter;

namespace {

void MarkChanged(SyncResult& result, model::Medium medium) {
  if (std::find(result.changed_media.begin(), result.changed_media.end(), medium) == result.changed_media.end()) {
    result.changed_media.push_back(medium);
  }
}

model::LedgerEntry MakeEntry(const model::ProgressRecord& record, const SyncContext& ctx, model::Medium medium, util::Decimal pages,
                             std::int64_t audio_seconds) {
  model::LedgerEntry entry;
  entry.progress_id      = record.id;
  entry.reader_id        = record.key.reader_id;
  entry.book_id          = record.key.book_id;
  entry.log_date         = ctx.log_date;
  entry.medium           = medium;
  entry.pages_equivalent = pages;
  entry.audio_seconds    = audio_seconds;
  entry.recorded_at      = ctx.occurred_at;
  return entry;
}

} // namespace

bool Synchronizer::ProjectOnto(model::MediumState& medium, std::optional<std::int64_t> reference_pages, util::Decimal percent) {
  const auto total = Converter::TotalForMedium(medium, reference_pages);
  if (!total) return false;

  const auto target = Converter::RawForPercent(*total, percent);
  if (target <= medium.RawValue()) return false;

  medium.SetRawValue(target);
  return true;
}

std::optional<std::int64_t> Synchronizer::RepresentativePage(const model::ProgressRecord& record, const std::vector<model::MediumState>& media,
                                                             std::optional<std::int64_t> reference_pages) {
  if (reference_pages) return Converter::RawForPercent(*reference_pages, record.percent);

  for (auto format : record.active_formats) {
    if (!model::IsPageBased(format)) continue;
    if (const auto* m = model::FindMedium(media, format)) return m->current_page;
  }
  return record.current_page;
}

SyncResult Synchronizer::ApplyUpdate(const model::ProgressRecord& record, const std::vector<model::MediumState>& media, model::Medium medium,
                                     std::int64_t raw_value, const SyncContext& ctx) {
  if (raw_value < 0) {
    throw util::InvalidRawValue("raw value must be non-negative, got " + std::to_string(raw_value));
  }

  SyncResult result;
  result.record           = record;
  result.media            = media;
  result.previous_percent = record.percent;

  auto* target = model::FindMedium(result.media, medium);
  if (!target || !record.IsActive(medium)) {
    throw util::NoActiveMedium(std::string(model::ToString(medium)) + " is not active for " + record.key.ToString());
  }

  const auto previous_raw = target->RawValue();
  const auto total        = Converter::TotalForMedium(*target, ctx.reference_pages);
  const auto new_raw      = total ? std::min(raw_value, *total) : raw_value;

  if (new_raw != previous_raw) {
    target->SetRawValue(new_raw);
    MarkChanged(result, medium);
  }
  result.record.updated_at = ctx.occurred_at;

  if (!total) {
    // Position only: no percent, no ledger, no projection.
    result.notice              = util::Reason::kUnknownBookLength;
    result.record.current_page = RepresentativePage(result.record, result.media, ctx.reference_pages);
    return result;
  }

  const auto new_percent = Converter::PercentOf(new_raw, *total);

  const auto previous_equivalent = Converter::ToPagesEquivalent(*target, previous_raw, ctx.reference_pages);
  const auto new_equivalent      = Converter::ToPagesEquivalent(*target, new_raw, ctx.reference_pages);
  if (previous_equivalent && new_equivalent) {
    const auto delta = *new_equivalent - *previous_equivalent;
    if (delta > util::Decimal{}) {
      std::int64_t audio_seconds = 0;
      if (!model::IsPageBased(medium)) {
        audio_seconds = Converter::ListenedSeconds(new_raw - previous_raw, Converter::EffectiveSpeed(record, *target));
      }
      result.delta_equivalent = delta;
      result.ledger.push_back(MakeEntry(result.record, ctx, medium, delta, audio_seconds));
    }
  } else {
    result.notice = util::Reason::kUnknownBookLength;
  }

  for (auto format : record.active_formats) {
    if (format == medium) continue;
    auto* other = model::FindMedium(result.media, format);
    if (other && ProjectOnto(*other, ctx.reference_pages, new_percent)) {
      MarkChanged(result, format);
    }
  }

  result.record.percent      = util::Max(record.percent, new_percent);
  result.record.current_page = RepresentativePage(result.record, result.media, ctx.reference_pages);
  return result;
}

SyncResult Synchronizer::Finish(const model::ProgressRecord& record, const std::vector<model::MediumState>& media, const SyncContext& ctx) {
  SyncResult result;
  result.record           = record;
  result.media            = media;
  result.previous_percent = record.percent;

  // Most advanced medium by equivalence; ties go to the earliest activated.
  const model::MediumState*    leader = nullptr;
  std::optional<util::Decimal> leader_equivalent;
  for (auto format : record.active_formats) {
    const auto* m = model::FindMedium(media, format);
    if (!m) continue;
    const auto equivalent = Converter::ToPagesEquivalent(*m, m->RawValue(), ctx.reference_pages);
    if (equivalent && (!leader_equivalent || *leader_equivalent < *equivalent)) {
      leader            = m;
      leader_equivalent = equivalent;
    }
  }

  if (ctx.reference_pages) {
    const auto reference = util::Decimal::FromInteger(*ctx.reference_pages);
    auto       medium    = record.active_formats.front();
    auto       base      = util::Decimal::FromRatio(*ctx.reference_pages * record.percent.Units(), 100 * util::Decimal::kScale,
                                                    Converter::kPlaces);
    std::int64_t audio_seconds = 0;
    if (leader) {
      medium = leader->medium;
      base   = *leader_equivalent;
      if (!model::IsPageBased(medium)) {
        const auto total = Converter::TotalForMedium(*leader, ctx.reference_pages);
        audio_seconds    = Converter::ListenedSeconds(std::max<std::int64_t>(*total - leader->RawValue(), 0),
                                                      Converter::EffectiveSpeed(record, *leader));
      }
    }
    const auto delta = reference - base;
    if (delta > util::Decimal{}) {
      result.delta_equivalent = delta;
      result.ledger.push_back(MakeEntry(record, ctx, medium, delta, audio_seconds));
    }
  } else {
    result.notice = util::Reason::kUnknownBookLength;
  }

  for (auto& m : result.media) {
    if (!record.IsActive(m.medium)) continue;
    const auto total = Converter::TotalForMedium(m, ctx.reference_pages);
    if (total && m.RawValue() != *total) {
      m.SetRawValue(*total);
      MarkChanged(result, m.medium);
    }
  }

  result.record.percent      = model::kFullPercent;
  result.record.state        = model::ProgressState::kComplete;
  result.record.completed_at = ctx.occurred_at;
  result.record.updated_at   = ctx.occurred_at;
  result.record.current_page = RepresentativePage(result.record, result.media, ctx.reference_pages);
  return result;
}

} // namespace pagewise::core
