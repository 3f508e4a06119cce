#include "memory_repository.hpp"

#include <algorithm>

#include "memory_tx.hpp"

namespace pagewise::db::memory {

namespace {

bool InRange(const util::Date& date, const std::optional<util::Date>& from, const std::optional<util::Date>& to) {
  if (from && date < *from) return false;
  if (to && *to < date) return false;
  return true;
}

} // namespace

std::string StorageKey(const model::ProgressKey& key) {
  std::string out;
  out.reserve(key.reader_id.size() + key.book_id.size() + key.context_id.size() + 2);
  out += key.reader_id;
  out += '\x1f';
  out += key.book_id;
  out += '\x1f';
  out += key.context_id;
  return out;
}

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

Result MemoryRepository::InsertProgress(Transaction& t, model::ProgressRecord& r) {
  auto&      tx  = TX(t);
  auto&      s   = tx.Mutable();
  const auto key = StorageKey(r.key);
  if (s.progress_by_key.contains(key)) return Result::Err(ErrorCode::AlreadyExists, "progress record exists for " + r.key.ToString());

  r.id      = next_progress_id_.fetch_add(1);
  r.version = 1;
  tx.MarkDirty(r.id);
  s.progress[r.id]       = r;
  s.progress_by_key[key] = r.id;
  return Result::Ok();
}

std::optional<model::ProgressRecord> MemoryRepository::GetProgress(Transaction& t, const model::ProgressKey& key) {
  const auto& s  = TX(t).View();
  const auto  it = s.progress_by_key.find(StorageKey(key));
  if (it == s.progress_by_key.end()) return std::nullopt;
  return s.progress.at(it->second);
}

std::optional<model::ProgressRecord> MemoryRepository::GetProgressById(Transaction& t, std::uint64_t id) {
  const auto& s  = TX(t).View();
  const auto  it = s.progress.find(id);
  if (it == s.progress.end()) return std::nullopt;
  return it->second;
}

std::vector<model::ProgressRecord> MemoryRepository::ListProgress(Transaction& t, const std::string& reader_id) {
  std::vector<model::ProgressRecord> out;
  for (const auto& [_, record] : TX(t).View().progress)
    if (record.key.reader_id == reader_id) out.push_back(record);
  return out;
}

Result MemoryRepository::UpdateProgress(Transaction& t, model::ProgressRecord& r) {
  auto& tx = TX(t);
  auto& s  = tx.Mutable();
  auto  it = s.progress.find(r.id);
  if (it == s.progress.end()) return Result::Err(ErrorCode::NotFound, "progress record " + std::to_string(r.id));
  if (!(it->second.key == r.key)) return Result::Err(ErrorCode::ConstraintViolation, "progress key is immutable");
  if (it->second.version != r.version) {
    return Result::Err(ErrorCode::Conflict, "progress record " + std::to_string(r.id) + " modified concurrently");
  }

  tx.MarkDirty(r.id);
  r.version  = it->second.version + 1;
  it->second = r;
  return Result::Ok();
}

Result MemoryRepository::UpsertMedium(Transaction& t, const model::MediumState& m) {
  auto& tx = TX(t);
  auto& s  = tx.Mutable();
  if (!s.progress.contains(m.progress_id)) return Result::Err(ErrorCode::NotFound, "progress record " + std::to_string(m.progress_id));

  tx.MarkDirty(m.progress_id);
  auto& media = s.media[m.progress_id];
  if (auto* existing = model::FindMedium(media, m.medium)) {
    *existing = m;
  } else {
    media.push_back(m);
  }
  return Result::Ok();
}

std::vector<model::MediumState> MemoryRepository::ListMedia(Transaction& t, std::uint64_t progress_id) {
  const auto& s  = TX(t).View();
  const auto  it = s.media.find(progress_id);
  if (it == s.media.end()) return {};
  auto out = it->second;
  std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) { return a.medium < b.medium; });
  return out;
}

Result MemoryRepository::DeleteMedium(Transaction& t, std::uint64_t progress_id, model::Medium medium) {
  auto& tx = TX(t);
  auto& s  = tx.Mutable();
  auto  it = s.media.find(progress_id);
  if (it == s.media.end()) return Result::Ok();

  tx.MarkDirty(progress_id);
  std::erase_if(it->second, [medium](const model::MediumState& m) { return m.medium == medium; });
  if (it->second.empty()) s.media.erase(it);
  return Result::Ok();
}

Result MemoryRepository::AppendLedgerEntries(Transaction& t, std::vector<model::LedgerEntry>& entries) {
  auto& tx = TX(t);
  for (const auto& e : entries) {
    if (e.pages_equivalent < util::Decimal{} || e.audio_seconds < 0) {
      return Result::Err(ErrorCode::ConstraintViolation, "ledger entries must be non-negative");
    }
  }
  for (const auto& e : entries) tx.StageLedger(e);
  return Result::Ok();
}

std::vector<model::LedgerEntry> MemoryRepository::ReadLedger(Transaction& t, const LedgerQuery& q) {
  std::vector<model::LedgerEntry> out;
  for (const auto& e : TX(t).View().ledger) {
    if (q.reader_id && e.reader_id != *q.reader_id) continue;
    if (q.progress_id && e.progress_id != *q.progress_id) continue;
    if (!InRange(e.log_date, q.from, q.to)) continue;
    out.push_back(e);
  }
  // Staged rows carry entry_id 0 until commit; keep their append order.
  std::stable_sort(out.begin(), out.end(), [](const auto& a, const auto& b) { return a.log_date < b.log_date; });
  return out;
}

Result MemoryRepository::InsertCompletion(Transaction& t, const model::CompletionRecord& r) {
  TX(t).StageCompletion(r);
  return Result::Ok();
}

std::vector<model::CompletionRecord> MemoryRepository::ListCompletions(Transaction& t, const CompletionQuery& q) {
  std::vector<model::CompletionRecord> out;
  for (const auto& c : TX(t).View().completions) {
    if (q.reader_id && c.reader_id != *q.reader_id) continue;
    if (!InRange(c.completed_on, q.from, q.to)) continue;
    out.push_back(c);
  }
  std::stable_sort(out.begin(), out.end(), [](const auto& a, const auto& b) { return a.completed_at < b.completed_at; });
  return out;
}

} // namespace pagewise::db::memory
