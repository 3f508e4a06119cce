#include "progress_engine.hpp"

#include <algorithm>
#include <stdexcept>

#include "internal/catalog/book_catalog.hpp"
#include "internal/equivalence/converter.hpp"
#include "internal/events/event_bus.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/duration.hpp"
#include "internal/util/errors.hpp"

namespace pagewise::core {

using equivalence::Converter;
using observability::IntField;
using observability::StringField;

namespace {

void ThrowIfDbError(const db::Result& result, const std::string& context) {
  if (result) {
    return;
  }

  const auto message = context + ": " + result.Describe();
  switch (result.code) {
    case db::ErrorCode::NotFound:
      throw util::NotFound(message);
    default:
      throw util::StorageFailure(message);
  }
}

/*
  Runs `fn` inside one repository transaction.

  Engine errors pass through unchanged. Anything else escaping the
  repository (backend exceptions, commit conflicts) becomes StorageFailure.
  In both cases the transaction is rolled back by its destructor.
*/
template <typename Fn>
auto InTransaction(db::Repository& repository, std::string_view operation, const model::ProgressKey& key, Fn&& fn) {
  try {
    auto tx  = repository.Begin();
    auto out = fn(*tx);
    tx->Commit();
    return out;
  } catch (const util::EngineError& ex) {
    if (ex.reason() == util::Reason::kStorageFailure) {
      PAGEWISE_LOG_WARN("transaction rolled back",
                        {StringField("operation", operation), StringField("key", key.ToString()), StringField("error", ex.what())});
    }
    throw;
  } catch (const std::exception& ex) {
    PAGEWISE_LOG_WARN("transaction rolled back",
                      {StringField("operation", operation), StringField("key", key.ToString()), StringField("error", ex.what())});
    throw util::StorageFailure(std::string(operation) + ": " + ex.what());
  }
}

void ValidateRaw(std::int64_t value, std::string_view what) {
  if (value < 0) {
    throw util::InvalidRawValue(std::string(what) + " must be non-negative, got " + std::to_string(value));
  }
}

void ValidatePositive(const std::optional<std::int64_t>& value, std::string_view what) {
  if (value && *value <= 0) {
    throw util::InvalidRawValue(std::string(what) + " must be positive, got " + std::to_string(*value));
  }
}

void ValidateSpeed(util::Decimal speed) {
  if (speed < model::kMinPlaybackSpeed || model::kMaxPlaybackSpeed < speed) {
    throw util::InvalidRawValue("playback speed must be within " + model::kMinPlaybackSpeed.ToString(1) + "-" +
                                model::kMaxPlaybackSpeed.ToString(1) + ", got " + speed.ToString(2));
  }
}

void SortByActivation(const model::ProgressRecord& record, std::vector<model::MediumState>& media) {
  auto rank = [&record](model::Medium m) {
    return std::find(record.active_formats.begin(), record.active_formats.end(), m) - record.active_formats.begin();
  };
  std::stable_sort(media.begin(), media.end(), [&rank](const auto& a, const auto& b) { return rank(a.medium) < rank(b.medium); });
}

// Clamps every medium to its total. Returns the media that moved.
std::vector<model::Medium> ClampToTotals(std::vector<model::MediumState>& media, std::optional<std::int64_t> reference_pages) {
  std::vector<model::Medium> changed;
  for (auto& m : media) {
    const auto total = Converter::TotalForMedium(m, reference_pages);
    if (total && m.RawValue() > *total) {
      m.SetRawValue(*total);
      changed.push_back(m.medium);
    }
  }
  return changed;
}

} // namespace

ProgressEngine::ProgressEngine(std::shared_ptr<db::Repository> repository, std::shared_ptr<catalog::BookCatalog> catalog,
                               std::shared_ptr<events::EventBus> events, EngineOptions options)
    : repository_(std::move(repository)), catalog_(std::move(catalog)), events_(std::move(events)), options_(options) {
  if (!repository_) {
    throw std::invalid_argument("progress engine requires a repository");
  }
  ValidateSpeed(options_.default_playback_speed);
}

std::shared_ptr<std::mutex> ProgressEngine::RecordMutex(const model::ProgressKey& key) {
  std::string name = key.reader_id;
  name += '\x1f';
  name += key.book_id;
  name += '\x1f';
  name += key.context_id;

  std::lock_guard<std::mutex> lock(record_mutexes_guard_);
  auto&                       record_mutex = record_mutexes_[name];
  if (!record_mutex) {
    record_mutex = std::make_shared<std::mutex>();
  }
  return record_mutex;
}

std::optional<std::int64_t> ProgressEngine::ReferencePages(const model::ProgressRecord& record) const {
  std::optional<std::int64_t> catalog_pages;
  if (catalog_) catalog_pages = catalog_->GetEffectiveTotalPages(record.key.book_id);
  return Converter::ReferencePages(record, catalog_pages);
}

SyncContext ProgressEngine::MakeContext(const model::ProgressRecord& record, util::TimePoint occurred_at) const {
  SyncContext ctx;
  ctx.reference_pages = ReferencePages(record);
  ctx.occurred_at     = occurred_at;
  ctx.log_date        = util::ToLocalDate(occurred_at, options_.utc_offset);
  return ctx;
}

// ------------------------------------------------------------
// Loading / persisting
// ------------------------------------------------------------

std::optional<ProgressEngine::Loaded> ProgressEngine::Load(db::Transaction& tx, const model::ProgressKey& key) {
  auto record = repository_->GetProgress(tx, key);
  if (!record) return std::nullopt;

  Loaded loaded;
  loaded.media  = repository_->ListMedia(tx, record->id);
  loaded.record = std::move(*record);
  SortByActivation(loaded.record, loaded.media);
  return loaded;
}

ProgressEngine::Loaded ProgressEngine::LoadOrCreate(db::Transaction& tx, const model::ProgressKey& key, model::Medium medium,
                                                    util::TimePoint occurred_at) {
  if (auto existing = Load(tx, key)) return std::move(*existing);

  Loaded loaded;
  loaded.created               = true;
  loaded.record.key            = key;
  loaded.record.active_formats = {medium};
  loaded.record.playback_speed = options_.default_playback_speed;
  loaded.record.state          = model::ProgressState::kInProgress;
  loaded.record.created_at     = occurred_at;
  loaded.record.updated_at     = occurred_at;
  ThrowIfDbError(repository_->InsertProgress(tx, loaded.record), "create progress " + key.ToString());

  model::MediumState state;
  state.progress_id = loaded.record.id;
  state.medium      = medium;
  ThrowIfDbError(repository_->UpsertMedium(tx, state), "create medium " + key.ToString());
  loaded.media.push_back(state);

  PAGEWISE_LOG_INFO("progress record created", {StringField("key", key.ToString()), StringField("medium", model::ToString(medium)),
                                                IntField("progress_id", static_cast<std::int64_t>(loaded.record.id))});
  return loaded;
}

void ProgressEngine::Persist(db::Transaction& tx, SyncResult& result) {
  const auto context = result.record.key.ToString();

  ThrowIfDbError(repository_->UpdateProgress(tx, result.record), "update progress " + context);
  for (auto medium : result.changed_media) {
    const auto* state = model::FindMedium(result.media, medium);
    if (!state) continue;
    ThrowIfDbError(repository_->UpsertMedium(tx, *state), "update medium " + context);
  }
  if (!result.ledger.empty()) {
    ThrowIfDbError(repository_->AppendLedgerEntries(tx, result.ledger), "append ledger " + context);
  }
}

// ------------------------------------------------------------
// Snapshots / events
// ------------------------------------------------------------

model::ProgressSnapshot ProgressEngine::Snapshot(const model::ProgressRecord& record, const std::vector<model::MediumState>& media) const {
  const auto reference = ReferencePages(record);

  model::ProgressSnapshot snapshot;
  snapshot.progress_id        = record.id;
  snapshot.key                = record.key;
  snapshot.state              = record.state;
  snapshot.percent            = record.percent;
  snapshot.current_page       = record.current_page;
  snapshot.total_pages        = reference;
  snapshot.custom_total_pages = record.custom_total_pages;
  snapshot.playback_speed     = record.playback_speed;
  snapshot.active_formats     = record.active_formats;
  snapshot.completed_at       = record.completed_at;
  snapshot.updated_at         = record.updated_at;

  if (reference) {
    const auto current  = record.current_page.value_or(0);
    snapshot.pages_left = std::max<std::int64_t>(*reference - current, 0);
  }

  for (auto format : record.active_formats) {
    const auto* m = model::FindMedium(media, format);
    if (!m) continue;

    model::MediumSnapshot ms;
    ms.medium           = m->medium;
    ms.raw_value        = m->RawValue();
    ms.total            = Converter::TotalForMedium(*m, reference);
    ms.pages_equivalent = Converter::ToPagesEquivalent(*m, m->RawValue(), reference);
    if (ms.total) ms.percent = Converter::PercentOf(m->RawValue(), *ms.total);
    if (!model::IsPageBased(m->medium)) ms.playback_speed = Converter::EffectiveSpeed(record, *m);
    snapshot.media.push_back(ms);
  }
  return snapshot;
}

model::ProgressSnapshot ProgressEngine::Snapshot(const SyncResult& result) const {
  auto snapshot         = Snapshot(result.record, result.media);
  snapshot.ledger_delta = result.delta_equivalent;
  snapshot.notice       = result.notice;
  return snapshot;
}

void ProgressEngine::PublishAdvanced(const model::ProgressRecord& record, util::Decimal previous_percent, util::TimePoint occurred_at) const {
  if (!events_ || !(previous_percent < record.percent)) return;

  events::ProgressAdvanced event;
  event.reader_id        = record.key.reader_id;
  event.book_id          = record.key.book_id;
  event.progress_id      = record.id;
  event.previous_percent = previous_percent;
  event.percent          = record.percent;
  event.occurred_at      = occurred_at;
  events_->Publish(event);
}

// ------------------------------------------------------------
// Reporting
// ------------------------------------------------------------

model::ProgressSnapshot ProgressEngine::ApplyRaw(
    const model::ProgressKey& key, model::Medium medium, util::TimePoint occurred_at,
    const std::function<std::int64_t(const model::ProgressRecord&, const model::MediumState&)>& next_raw) {
  bool                    applied = false;
  SyncResult              result;
  model::ProgressSnapshot snapshot;

  {
    std::lock_guard<std::mutex> record_lock(*RecordMutex(key));
    snapshot = InTransaction(*repository_, "report progress", key, [&](db::Transaction& tx) {
      auto existing = Load(tx, key);
      if (existing && existing->record.state == model::ProgressState::kComplete) {
        auto done   = Snapshot(existing->record, existing->media);
        done.notice = util::Reason::kAlreadyComplete;
        return done;
      }
      if (existing && !existing->record.IsActive(medium)) {
        throw util::NoActiveMedium(std::string(model::ToString(medium)) + " is not active for " + key.ToString() + "; activate it first");
      }

      auto  loaded = existing ? std::move(*existing) : LoadOrCreate(tx, key, medium, occurred_at);
      auto* state  = model::FindMedium(loaded.media, medium);
      if (!state) {
        throw util::InvalidState("active format " + std::string(model::ToString(medium)) + " has no stored position for " + key.ToString());
      }

      const auto raw = next_raw(loaded.record, *state);
      ValidateRaw(raw, "position");

      result = Synchronizer::ApplyUpdate(loaded.record, loaded.media, medium, raw, MakeContext(loaded.record, occurred_at));
      Persist(tx, result);
      applied = true;
      return Snapshot(result);
    });
  }

  // Subscribers run without the record lock and may call back into the engine.
  if (applied) {
    if (result.notice == util::Reason::kUnknownBookLength) {
      PAGEWISE_LOG_INFO("position recorded without page equivalence",
                        {StringField("key", key.ToString()), StringField("medium", model::ToString(medium))});
    }
    PublishAdvanced(result.record, result.previous_percent, occurred_at);
  }
  return snapshot;
}

model::ProgressSnapshot ProgressEngine::ReportProgress(const model::ProgressKey& key, model::Medium medium, std::int64_t raw_value,
                                                       util::TimePoint occurred_at) {
  ValidateRaw(raw_value, "raw value");
  return ApplyRaw(key, medium, occurred_at, [raw_value](const model::ProgressRecord&, const model::MediumState&) { return raw_value; });
}

model::ProgressSnapshot ProgressEngine::ReportAudioPosition(const model::ProgressKey& key, std::string_view position,
                                                            util::TimePoint occurred_at) {
  const auto seconds = util::ParseDuration(position);
  return ReportProgress(key, model::Medium::kAudio, seconds.count(), occurred_at);
}

model::ProgressSnapshot ProgressEngine::ReportListening(const model::ProgressKey& key, std::int64_t listened_seconds,
                                                        util::TimePoint occurred_at) {
  ValidateRaw(listened_seconds, "listened seconds");
  return ApplyRaw(key, model::Medium::kAudio, occurred_at, [listened_seconds](const model::ProgressRecord& record, const model::MediumState& audio) {
    return audio.position_seconds + Converter::AdjustForSpeed(listened_seconds, Converter::EffectiveSpeed(record, audio));
  });
}

model::ProgressSnapshot ProgressEngine::MarkFinished(const model::ProgressKey& key, util::TimePoint occurred_at) {
  bool                    completed = false;
  SyncResult              result;
  model::ProgressSnapshot snapshot;

  {
    std::lock_guard<std::mutex> record_lock(*RecordMutex(key));
    snapshot = InTransaction(*repository_, "mark finished", key, [&](db::Transaction& tx) {
      auto loaded = LoadOrCreate(tx, key, model::Medium::kPaper, occurred_at);
      if (loaded.record.state == model::ProgressState::kComplete) {
        auto done   = Snapshot(loaded.record, loaded.media);
        done.notice = util::Reason::kAlreadyComplete;
        return done;
      }

      const auto ctx = MakeContext(loaded.record, occurred_at);
      result         = Synchronizer::Finish(loaded.record, loaded.media, ctx);
      Persist(tx, result);

      model::CompletionRecord completion;
      completion.reader_id    = key.reader_id;
      completion.book_id      = key.book_id;
      completion.progress_id  = result.record.id;
      completion.completed_on = ctx.log_date;
      completion.completed_at = occurred_at;
      ThrowIfDbError(repository_->InsertCompletion(tx, completion), "record completion " + key.ToString());

      completed = true;
      return Snapshot(result);
    });
  }

  if (completed) {
    PAGEWISE_LOG_INFO("book completed", {StringField("key", key.ToString()), observability::DecimalField("final_delta", result.delta_equivalent)});
    PublishAdvanced(result.record, result.previous_percent, occurred_at);
    if (events_) {
      events_->Publish(events::BookCompleted{key.reader_id, key.book_id, result.record.id, occurred_at});
    }
  }
  return snapshot;
}

// ------------------------------------------------------------
// Reads
// ------------------------------------------------------------

std::optional<model::ProgressSnapshot> ProgressEngine::GetProgress(const model::ProgressKey& key) {
  return InTransaction(*repository_, "get progress", key, [&](db::Transaction& tx) -> std::optional<model::ProgressSnapshot> {
    auto loaded = Load(tx, key);
    if (!loaded) return std::nullopt;
    return Snapshot(loaded->record, loaded->media);
  });
}

std::vector<model::ProgressSnapshot> ProgressEngine::ListProgress(const std::string& reader_id) {
  const model::ProgressKey scope{reader_id, "*", ""};
  return InTransaction(*repository_, "list progress", scope, [&](db::Transaction& tx) {
    std::vector<model::ProgressSnapshot> out;
    for (const auto& record : repository_->ListProgress(tx, reader_id)) {
      auto media = repository_->ListMedia(tx, record.id);
      SortByActivation(record, media);
      out.push_back(Snapshot(record, media));
    }
    return out;
  });
}

// ------------------------------------------------------------
// Formats / settings
// ------------------------------------------------------------

model::ProgressSnapshot ProgressEngine::ActivateFormat(const model::ProgressKey& key, model::Medium medium, const MediumSettings& settings,
                                                       util::TimePoint occurred_at) {
  ValidatePositive(settings.total_pages, "total pages");
  ValidatePositive(settings.length_seconds, "audio length");
  if (settings.position) ValidateRaw(*settings.position, "position");
  if (settings.playback_speed) ValidateSpeed(*settings.playback_speed);
  if (settings.total_pages && !model::IsPageBased(medium)) {
    throw util::InvalidRawValue("total pages apply to paper and ebook formats only");
  }
  if ((settings.length_seconds || settings.playback_speed) && model::IsPageBased(medium)) {
    throw util::InvalidRawValue("audio length and speed apply to the audiobook format only");
  }

  bool                    advanced = false;
  SyncResult              result;
  model::ProgressSnapshot snapshot;

  {
    std::lock_guard<std::mutex> record_lock(*RecordMutex(key));
    snapshot = InTransaction(*repository_, "activate format", key, [&](db::Transaction& tx) {
      auto  loaded = LoadOrCreate(tx, key, medium, occurred_at);
      auto& record = loaded.record;
      if (record.state == model::ProgressState::kComplete && settings.position) {
        throw util::InvalidState("cannot set a starting position on finished " + key.ToString());
      }

      const bool newly_active = !record.IsActive(medium);
      if (newly_active) {
        record.active_formats.push_back(medium);
        model::MediumState fresh;
        fresh.progress_id = record.id;
        fresh.medium      = medium;
        loaded.media.push_back(fresh);
      }

      auto* state = model::FindMedium(loaded.media, medium);
      if (settings.total_pages) state->total_pages_override = settings.total_pages;
      if (settings.length_seconds) state->length_seconds = settings.length_seconds;
      if (settings.playback_speed) state->playback_speed = settings.playback_speed;

      // Activation itself never writes ledger rows; it only aligns the format.
      const auto reference = ReferencePages(record);
      for (auto clamped : ClampToTotals(loaded.media, reference)) {
        if (clamped == medium) continue;
        ThrowIfDbError(repository_->UpsertMedium(tx, *model::FindMedium(loaded.media, clamped)), "activate format " + key.ToString());
      }
      Synchronizer::ProjectOnto(*state, reference, record.percent);

      record.updated_at   = occurred_at;
      record.current_page = Synchronizer::RepresentativePage(record, loaded.media, reference);
      ThrowIfDbError(repository_->UpdateProgress(tx, record), "activate format " + key.ToString());
      ThrowIfDbError(repository_->UpsertMedium(tx, *state), "activate format " + key.ToString());

      if (newly_active && !loaded.created) {
        PAGEWISE_LOG_INFO("format activated", {StringField("key", key.ToString()), StringField("medium", model::ToString(medium)),
                                               IntField("position", state->RawValue())});
      }

      // A starting position is a report on the new format: pages past the
      // projection reach the ledger together with the percent they raise.
      if (settings.position && *settings.position != state->RawValue()) {
        result = Synchronizer::ApplyUpdate(record, loaded.media, medium, *settings.position, MakeContext(record, occurred_at));
        Persist(tx, result);
        advanced = true;
        return Snapshot(result);
      }
      return Snapshot(record, loaded.media);
    });
  }

  if (advanced) PublishAdvanced(result.record, result.previous_percent, occurred_at);
  return snapshot;
}

model::ProgressSnapshot ProgressEngine::DeactivateFormat(const model::ProgressKey& key, model::Medium medium, util::TimePoint occurred_at) {
  std::lock_guard<std::mutex> record_lock(*RecordMutex(key));

  return InTransaction(*repository_, "deactivate format", key, [&](db::Transaction& tx) {
    auto loaded = Load(tx, key);
    if (!loaded) throw util::NotFound("no progress record for " + key.ToString());

    auto& record = loaded->record;
    if (!record.IsActive(medium)) {
      throw util::NoActiveMedium(std::string(model::ToString(medium)) + " is not active for " + key.ToString());
    }
    if (record.active_formats.size() == 1) {
      throw util::InvalidState("cannot deactivate the last active format of " + key.ToString());
    }

    std::erase(record.active_formats, medium);
    std::erase_if(loaded->media, [medium](const model::MediumState& m) { return m.medium == medium; });

    record.updated_at   = occurred_at;
    record.current_page = Synchronizer::RepresentativePage(record, loaded->media, ReferencePages(record));
    ThrowIfDbError(repository_->DeleteMedium(tx, record.id, medium), "deactivate format " + key.ToString());
    ThrowIfDbError(repository_->UpdateProgress(tx, record), "deactivate format " + key.ToString());
    return Snapshot(record, loaded->media);
  });
}

model::ProgressSnapshot ProgressEngine::SetCustomTotalPages(const model::ProgressKey& key, std::optional<std::int64_t> pages,
                                                            util::TimePoint occurred_at) {
  ValidatePositive(pages, "custom total pages");

  std::lock_guard<std::mutex> record_lock(*RecordMutex(key));

  return InTransaction(*repository_, "set custom total pages", key, [&](db::Transaction& tx) {
    auto loaded = Load(tx, key);
    if (!loaded) throw util::NotFound("no progress record for " + key.ToString());

    auto& record              = loaded->record;
    record.custom_total_pages = pages;
    record.updated_at         = occurred_at;

    // Past ledger rows are never backfilled; only positions are kept within bounds.
    const auto reference = ReferencePages(record);
    for (auto medium : ClampToTotals(loaded->media, reference)) {
      ThrowIfDbError(repository_->UpsertMedium(tx, *model::FindMedium(loaded->media, medium)), "set custom total pages " + key.ToString());
    }
    record.current_page = Synchronizer::RepresentativePage(record, loaded->media, reference);
    ThrowIfDbError(repository_->UpdateProgress(tx, record), "set custom total pages " + key.ToString());
    return Snapshot(record, loaded->media);
  });
}

model::ProgressSnapshot ProgressEngine::SetPlaybackSpeed(const model::ProgressKey& key, util::Decimal speed, util::TimePoint occurred_at) {
  ValidateSpeed(speed);

  std::lock_guard<std::mutex> record_lock(*RecordMutex(key));

  return InTransaction(*repository_, "set playback speed", key, [&](db::Transaction& tx) {
    auto loaded = Load(tx, key);
    if (!loaded) throw util::NotFound("no progress record for " + key.ToString());

    auto& record          = loaded->record;
    record.playback_speed = speed;
    record.updated_at     = occurred_at;
    ThrowIfDbError(repository_->UpdateProgress(tx, record), "set playback speed " + key.ToString());
    return Snapshot(record, loaded->media);
  });
}

} // namespace pagewise::core
