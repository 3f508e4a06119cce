#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "internal/core/synchronizer.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/model/snapshot.hpp"

namespace pagewise::catalog {
class BookCatalog;
}
namespace pagewise::events {
class EventBus;
}

namespace pagewise::core {

struct EngineOptions {
  util::Decimal        default_playback_speed = model::kDefaultPlaybackSpeed;
  std::chrono::minutes utc_offset{0};
};

// Per-format settings supplied when a format is activated or reconfigured.
struct MediumSettings {
  std::optional<std::int64_t>  total_pages;    // page media: this edition's page count
  std::optional<std::int64_t>  length_seconds; // audio: full length in book time
  std::optional<util::Decimal> playback_speed; // audio: overrides the record speed
  std::optional<std::int64_t>  position;       // starting raw position
};

/*
  Transactional façade over the synchronizer.

  Every write call:
    - validates its input before touching storage
    - takes the per-record mutex for (reader, book, context)
    - runs inside exactly one repository transaction; any failure rolls back
      the record, its media, ledger rows and completion row together
    - publishes events only after a successful commit, with the record
      mutex released, so subscribers may call back into the engine
*/
class ProgressEngine {
 public:
  ProgressEngine(std::shared_ptr<db::Repository> repository, std::shared_ptr<catalog::BookCatalog> catalog,
                 std::shared_ptr<events::EventBus> events, EngineOptions options = {});

  model::ProgressSnapshot ReportProgress(const model::ProgressKey& key, model::Medium medium, std::int64_t raw_value,
                                         util::TimePoint occurred_at);

  // Audio position given as "SS", "MM:SS" or "HH:MM:SS".
  model::ProgressSnapshot ReportAudioPosition(const model::ProgressKey& key, std::string_view position, util::TimePoint occurred_at);

  // Advances the audio position by listened_seconds * playback speed.
  model::ProgressSnapshot ReportListening(const model::ProgressKey& key, std::int64_t listened_seconds, util::TimePoint occurred_at);

  model::ProgressSnapshot MarkFinished(const model::ProgressKey& key, util::TimePoint occurred_at);

  std::optional<model::ProgressSnapshot> GetProgress(const model::ProgressKey& key);
  std::vector<model::ProgressSnapshot>   ListProgress(const std::string& reader_id);

  model::ProgressSnapshot ActivateFormat(const model::ProgressKey& key, model::Medium medium, const MediumSettings& settings,
                                         util::TimePoint occurred_at);
  model::ProgressSnapshot DeactivateFormat(const model::ProgressKey& key, model::Medium medium, util::TimePoint occurred_at);

  // nullopt clears the override and falls back to the catalog.
  model::ProgressSnapshot SetCustomTotalPages(const model::ProgressKey& key, std::optional<std::int64_t> pages, util::TimePoint occurred_at);
  model::ProgressSnapshot SetPlaybackSpeed(const model::ProgressKey& key, util::Decimal speed, util::TimePoint occurred_at);

  const EngineOptions& options() const {
    return options_;
  }

 private:
  struct Loaded {
    model::ProgressRecord           record;
    std::vector<model::MediumState> media;
    bool                            created = false;
  };

  std::shared_ptr<std::mutex> RecordMutex(const model::ProgressKey& key);

  std::optional<std::int64_t> ReferencePages(const model::ProgressRecord& record) const;
  SyncContext                 MakeContext(const model::ProgressRecord& record, util::TimePoint occurred_at) const;

  std::optional<Loaded> Load(db::Transaction& tx, const model::ProgressKey& key);
  Loaded                LoadOrCreate(db::Transaction& tx, const model::ProgressKey& key, model::Medium medium, util::TimePoint occurred_at);

  void Persist(db::Transaction& tx, SyncResult& result);

  model::ProgressSnapshot Snapshot(const model::ProgressRecord& record, const std::vector<model::MediumState>& media) const;
  model::ProgressSnapshot Snapshot(const SyncResult& result) const;

  void PublishAdvanced(const model::ProgressRecord& record, util::Decimal previous_percent, util::TimePoint occurred_at) const;

  model::ProgressSnapshot ApplyRaw(const model::ProgressKey& key, model::Medium medium, util::TimePoint occurred_at,
                                   const std::function<std::int64_t(const model::ProgressRecord&, const model::MediumState&)>& next_raw);

  std::shared_ptr<db::Repository>       repository_;
  std::shared_ptr<catalog::BookCatalog> catalog_;
  std::shared_ptr<events::EventBus>     events_;
  EngineOptions                         options_;

  mutable std::mutex                                                   record_mutexes_guard_;
  std::unordered_map<std::string, std::shared_ptr<std::mutex>> record_mutexes_;
};

} // namespace pagewise::core
