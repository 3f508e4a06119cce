#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <stdexcept>

#include "internal/db/sql/sql_params.hpp"
#include "internal/db/sql/sql_queries.hpp"

namespace pagewise::db::sqlite {

using pagewise::db::ErrorCode;
using pagewise::db::Result;

namespace {

// Finalizes on scope exit.
struct Statement {
  sqlite3_stmt* st = nullptr;

  Statement() = default;
  Statement(const Statement&)            = delete;
  Statement& operator=(const Statement&) = delete;
  ~Statement() {
    if (st) sqlite3_finalize(st);
  }
};

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

void BindI64(sqlite3_stmt* st, int idx, std::int64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void Bind(sqlite3_stmt* st, const sql::Params& params) {
  int idx = 1;
  for (const auto& p : params) {
    if (std::holds_alternative<std::nullptr_t>(p)) {
      sqlite3_bind_null(st, idx);
    } else if (const auto* i = std::get_if<std::int64_t>(&p)) {
      BindI64(st, idx, *i);
    } else {
      BindText(st, idx, std::get<std::string>(p));
    }
    ++idx;
  }
}

std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

std::int64_t ColI64(sqlite3_stmt* st, int col) {
  return static_cast<std::int64_t>(sqlite3_column_int64(st, col));
}

std::uint64_t ColU64(sqlite3_stmt* st, int col) {
  return static_cast<std::uint64_t>(sqlite3_column_int64(st, col));
}

std::optional<std::int64_t> ColOptI64(sqlite3_stmt* st, int col) {
  if (sqlite3_column_type(st, col) == SQLITE_NULL) return std::nullopt;
  return ColI64(st, col);
}

model::Medium ColMedium(sqlite3_stmt* st, int col) {
  const auto medium = model::MediumFromCode(sqlite3_column_int(st, col));
  if (!medium) throw std::runtime_error("unknown medium code in column " + std::to_string(col));
  return *medium;
}

std::int64_t Millis(util::TimePoint tp) {
  return static_cast<std::int64_t>(util::ToUnixMillis(tp));
}

util::TimePoint ColTime(sqlite3_stmt* st, int col) {
  return util::FromUnixMillis(ColU64(st, col));
}

// "1,3" <-> {kPaper, kAudio}; activation order is preserved.
std::string EncodeFormats(const std::vector<model::Medium>& formats) {
  std::string out;
  for (auto m : formats) {
    if (!out.empty()) out += ',';
    out += std::to_string(static_cast<int>(m));
  }
  return out;
}

std::vector<model::Medium> DecodeFormats(const std::string& text) {
  std::vector<model::Medium> out;
  std::size_t                start = 0;
  while (start < text.size()) {
    auto end = text.find(',', start);
    if (end == std::string::npos) end = text.size();
    const auto medium = model::MediumFromCode(std::stoi(text.substr(start, end - start)));
    if (!medium) throw std::runtime_error("unknown medium code in active_formats: " + text);
    out.push_back(*medium);
    start = end + 1;
  }
  return out;
}

model::ProgressRecord ReadProgressRow(sqlite3_stmt* st) {
  model::ProgressRecord r;
  r.id                 = ColU64(st, 0);
  r.key.reader_id      = ColText(st, 1);
  r.key.book_id        = ColText(st, 2);
  r.key.context_id     = ColText(st, 3);
  r.percent            = util::Decimal::FromUnits(ColI64(st, 4));
  r.active_formats     = DecodeFormats(ColText(st, 5));
  r.custom_total_pages = ColOptI64(st, 6);
  r.playback_speed     = util::Decimal::FromUnits(ColI64(st, 7));
  r.current_page       = ColOptI64(st, 8);
  r.state              = static_cast<model::ProgressState>(sqlite3_column_int(st, 9));
  if (auto completed = ColOptI64(st, 10)) r.completed_at = util::FromUnixMillis(static_cast<std::uint64_t>(*completed));
  r.created_at = ColTime(st, 11);
  r.updated_at = ColTime(st, 12);
  r.version    = ColU64(st, 13);
  return r;
}

model::LedgerEntry ReadLedgerRow(sqlite3_stmt* st) {
  model::LedgerEntry e;
  e.entry_id         = ColU64(st, 0);
  e.progress_id      = ColU64(st, 1);
  e.reader_id        = ColText(st, 2);
  e.book_id          = ColText(st, 3);
  e.log_date         = util::ParseDate(ColText(st, 4));
  e.medium           = ColMedium(st, 5);
  e.pages_equivalent = util::Decimal::FromUnits(ColI64(st, 6));
  e.audio_seconds    = ColI64(st, 7);
  e.recorded_at      = ColTime(st, 8);
  return e;
}

void AppendDateRange(std::string& sql, sql::Params& params, const char* column, const std::optional<util::Date>& from,
                     const std::optional<util::Date>& to) {
  if (from) {
    sql += std::string(" AND ") + column + ">=?";
    params.emplace_back(util::FormatDate(*from));
  }
  if (to) {
    sql += std::string(" AND ") + column + "<=?";
    params.emplace_back(util::FormatDate(*to));
  }
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
  return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
  return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW) return Result::Ok();

  switch (rc) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
    case SQLITE_CONSTRAINT:
      if (sqlite3_extended_errcode(db) == SQLITE_CONSTRAINT_UNIQUE) {
        return Result::Err(ErrorCode::AlreadyExists, sqlite3_errmsg(db));
      }
      return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
    case SQLITE_IOERR:
      return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
    case SQLITE_CORRUPT:
      return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
    default:
      return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
}

// ------------------------------------------------------------------
// Progress
// ------------------------------------------------------------------

Result SqliteRepository::InsertProgress(Transaction& t, model::ProgressRecord& r) {
  auto* db = TX(t).Handle();

  Statement s;
  if (sqlite3_prepare_v2(db, sql::INSERT_PROGRESS, -1, &s.st, nullptr) != SQLITE_OK) {
    return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }

  sql::Params params{r.key.reader_id,
                     r.key.book_id,
                     r.key.context_id,
                     r.percent.Units(),
                     EncodeFormats(r.active_formats),
                     sql::Nullable(r.custom_total_pages),
                     r.playback_speed.Units(),
                     sql::Nullable(r.current_page),
                     static_cast<std::int64_t>(r.state),
                     r.completed_at ? sql::Param{Millis(*r.completed_at)} : sql::Param{nullptr},
                     Millis(r.created_at),
                     Millis(r.updated_at),
                     std::int64_t{1}};
  Bind(s.st, params);

  const int rc = sqlite3_step(s.st);
  if (rc != SQLITE_DONE) {
    auto result = Translate(db, rc);
    if (result.code == ErrorCode::AlreadyExists) result.message = "progress record exists for " + r.key.ToString();
    return result;
  }

  r.id      = static_cast<std::uint64_t>(sqlite3_last_insert_rowid(db));
  r.version = 1;
  return Result::Ok();
}

std::optional<model::ProgressRecord> SqliteRepository::GetProgress(Transaction& t, const model::ProgressKey& key) {
  auto* db = TX(t).Handle();

  Statement s;
  const std::string sql = std::string(sql::SELECT_PROGRESS_COLUMNS) + " WHERE reader_id=? AND book_id=? AND context_id=?;";
  if (sqlite3_prepare_v2(db, sql.c_str(), -1, &s.st, nullptr) != SQLITE_OK) {
    throw std::runtime_error(std::string("GetProgress prepare: ") + sqlite3_errmsg(db));
  }
  Bind(s.st, {key.reader_id, key.book_id, key.context_id});

  const int rc = sqlite3_step(s.st);
  if (rc == SQLITE_DONE) return std::nullopt;
  if (rc != SQLITE_ROW) throw std::runtime_error(std::string("GetProgress: ") + sqlite3_errmsg(db));
  return ReadProgressRow(s.st);
}

std::optional<model::ProgressRecord> SqliteRepository::GetProgressById(Transaction& t, std::uint64_t id) {
  auto* db = TX(t).Handle();

  Statement s;
  const std::string sql = std::string(sql::SELECT_PROGRESS_COLUMNS) + " WHERE id=?;";
  if (sqlite3_prepare_v2(db, sql.c_str(), -1, &s.st, nullptr) != SQLITE_OK) {
    throw std::runtime_error(std::string("GetProgressById prepare: ") + sqlite3_errmsg(db));
  }
  BindI64(s.st, 1, static_cast<std::int64_t>(id));

  const int rc = sqlite3_step(s.st);
  if (rc == SQLITE_DONE) return std::nullopt;
  if (rc != SQLITE_ROW) throw std::runtime_error(std::string("GetProgressById: ") + sqlite3_errmsg(db));
  return ReadProgressRow(s.st);
}

std::vector<model::ProgressRecord> SqliteRepository::ListProgress(Transaction& t, const std::string& reader_id) {
  auto* db = TX(t).Handle();

  Statement s;
  const std::string sql = std::string(sql::SELECT_PROGRESS_COLUMNS) + " WHERE reader_id=? ORDER BY id;";
  if (sqlite3_prepare_v2(db, sql.c_str(), -1, &s.st, nullptr) != SQLITE_OK) {
    throw std::runtime_error(std::string("ListProgress prepare: ") + sqlite3_errmsg(db));
  }
  BindText(s.st, 1, reader_id);

  std::vector<model::ProgressRecord> out;
  int                                rc;
  while ((rc = sqlite3_step(s.st)) == SQLITE_ROW) out.push_back(ReadProgressRow(s.st));
  if (rc != SQLITE_DONE) throw std::runtime_error(std::string("ListProgress: ") + sqlite3_errmsg(db));
  return out;
}

Result SqliteRepository::UpdateProgress(Transaction& t, model::ProgressRecord& r) {
  auto* db = TX(t).Handle();

  Statement s;
  if (sqlite3_prepare_v2(db, sql::UPDATE_PROGRESS, -1, &s.st, nullptr) != SQLITE_OK) {
    return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }

  sql::Params params{r.percent.Units(),
                     EncodeFormats(r.active_formats),
                     sql::Nullable(r.custom_total_pages),
                     r.playback_speed.Units(),
                     sql::Nullable(r.current_page),
                     static_cast<std::int64_t>(r.state),
                     r.completed_at ? sql::Param{Millis(*r.completed_at)} : sql::Param{nullptr},
                     Millis(r.updated_at),
                     static_cast<std::int64_t>(r.id),
                     static_cast<std::int64_t>(r.version)};
  Bind(s.st, params);

  const int rc = sqlite3_step(s.st);
  if (rc != SQLITE_DONE) return Translate(db, rc);

  if (sqlite3_changes(db) == 0) {
    Statement exists;
    if (sqlite3_prepare_v2(db, "SELECT 1 FROM progress WHERE id=?;", -1, &exists.st, nullptr) != SQLITE_OK) {
      return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    }
    BindI64(exists.st, 1, static_cast<std::int64_t>(r.id));
    if (sqlite3_step(exists.st) != SQLITE_ROW) return Result::Err(ErrorCode::NotFound, "progress record " + std::to_string(r.id));
    return Result::Err(ErrorCode::Conflict, "progress record " + std::to_string(r.id) + " modified concurrently");
  }
  ++r.version;
  return Result::Ok();
}

// ------------------------------------------------------------------
// Media
// ------------------------------------------------------------------

Result SqliteRepository::UpsertMedium(Transaction& t, const model::MediumState& m) {
  auto* db = TX(t).Handle();

  Statement s;
  if (sqlite3_prepare_v2(db, sql::UPSERT_MEDIUM, -1, &s.st, nullptr) != SQLITE_OK) {
    return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }

  sql::Params params{static_cast<std::int64_t>(m.progress_id),
                     static_cast<std::int64_t>(m.medium),
                     m.current_page,
                     sql::Nullable(m.total_pages_override),
                     m.position_seconds,
                     sql::Nullable(m.length_seconds),
                     m.playback_speed ? sql::Param{m.playback_speed->Units()} : sql::Param{nullptr}};
  Bind(s.st, params);

  const int rc = sqlite3_step(s.st);
  if (rc == SQLITE_CONSTRAINT && sqlite3_extended_errcode(db) == SQLITE_CONSTRAINT_FOREIGNKEY) {
    return Result::Err(ErrorCode::NotFound, "progress record " + std::to_string(m.progress_id));
  }
  return Translate(db, rc);
}

std::vector<model::MediumState> SqliteRepository::ListMedia(Transaction& t, std::uint64_t progress_id) {
  auto* db = TX(t).Handle();

  Statement s;
  if (sqlite3_prepare_v2(db, sql::SELECT_MEDIA, -1, &s.st, nullptr) != SQLITE_OK) {
    throw std::runtime_error(std::string("ListMedia prepare: ") + sqlite3_errmsg(db));
  }
  BindI64(s.st, 1, static_cast<std::int64_t>(progress_id));

  std::vector<model::MediumState> out;
  int                             rc;
  while ((rc = sqlite3_step(s.st)) == SQLITE_ROW) {
    model::MediumState m;
    m.progress_id          = ColU64(s.st, 0);
    m.medium               = ColMedium(s.st, 1);
    m.current_page         = ColI64(s.st, 2);
    m.total_pages_override = ColOptI64(s.st, 3);
    m.position_seconds     = ColI64(s.st, 4);
    m.length_seconds       = ColOptI64(s.st, 5);
    if (auto speed = ColOptI64(s.st, 6)) m.playback_speed = util::Decimal::FromUnits(*speed);
    out.push_back(std::move(m));
  }
  if (rc != SQLITE_DONE) throw std::runtime_error(std::string("ListMedia: ") + sqlite3_errmsg(db));
  return out;
}

Result SqliteRepository::DeleteMedium(Transaction& t, std::uint64_t progress_id, model::Medium medium) {
  auto* db = TX(t).Handle();

  Statement s;
  if (sqlite3_prepare_v2(db, sql::DELETE_MEDIUM, -1, &s.st, nullptr) != SQLITE_OK) {
    return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
  BindI64(s.st, 1, static_cast<std::int64_t>(progress_id));
  BindI64(s.st, 2, static_cast<std::int64_t>(medium));

  return Translate(db, sqlite3_step(s.st));
}

// ------------------------------------------------------------------
// Ledger
// ------------------------------------------------------------------

Result SqliteRepository::AppendLedgerEntries(Transaction& t, std::vector<model::LedgerEntry>& entries) {
  auto* db = TX(t).Handle();

  for (const auto& e : entries) {
    if (e.pages_equivalent < util::Decimal{} || e.audio_seconds < 0) {
      return Result::Err(ErrorCode::ConstraintViolation, "ledger entries must be non-negative");
    }
  }

  Statement s;
  if (sqlite3_prepare_v2(db, sql::INSERT_LEDGER_ENTRY, -1, &s.st, nullptr) != SQLITE_OK) {
    return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }

  for (auto& e : entries) {
    sqlite3_reset(s.st);
    sqlite3_clear_bindings(s.st);

    Bind(s.st, {static_cast<std::int64_t>(e.progress_id), e.reader_id, e.book_id, util::FormatDate(e.log_date),
                static_cast<std::int64_t>(e.medium), e.pages_equivalent.Units(), e.audio_seconds, Millis(e.recorded_at)});

    const int rc = sqlite3_step(s.st);
    if (rc != SQLITE_DONE) return Translate(db, rc);
    e.entry_id = static_cast<std::uint64_t>(sqlite3_last_insert_rowid(db));
  }
  return Result::Ok();
}

std::vector<model::LedgerEntry> SqliteRepository::ReadLedger(Transaction& t, const LedgerQuery& q) {
  auto* db = TX(t).Handle();

  std::string sql = std::string(sql::SELECT_LEDGER_COLUMNS) + " WHERE 1=1";
  sql::Params params;
  if (q.reader_id) {
    sql += " AND reader_id=?";
    params.emplace_back(*q.reader_id);
  }
  if (q.progress_id) {
    sql += " AND progress_id=?";
    params.emplace_back(static_cast<std::int64_t>(*q.progress_id));
  }
  AppendDateRange(sql, params, "log_date", q.from, q.to);
  sql += " ORDER BY log_date, entry_id;";

  Statement s;
  if (sqlite3_prepare_v2(db, sql.c_str(), -1, &s.st, nullptr) != SQLITE_OK) {
    throw std::runtime_error(std::string("ReadLedger prepare: ") + sqlite3_errmsg(db));
  }
  Bind(s.st, params);

  std::vector<model::LedgerEntry> out;
  int                             rc;
  while ((rc = sqlite3_step(s.st)) == SQLITE_ROW) out.push_back(ReadLedgerRow(s.st));
  if (rc != SQLITE_DONE) throw std::runtime_error(std::string("ReadLedger: ") + sqlite3_errmsg(db));
  return out;
}

// ------------------------------------------------------------------
// Completions
// ------------------------------------------------------------------

Result SqliteRepository::InsertCompletion(Transaction& t, const model::CompletionRecord& r) {
  auto* db = TX(t).Handle();

  Statement s;
  if (sqlite3_prepare_v2(db, sql::INSERT_COMPLETION, -1, &s.st, nullptr) != SQLITE_OK) {
    return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
  Bind(s.st, {r.reader_id, r.book_id, static_cast<std::int64_t>(r.progress_id), util::FormatDate(r.completed_on),
              Millis(r.completed_at)});

  return Translate(db, sqlite3_step(s.st));
}

std::vector<model::CompletionRecord> SqliteRepository::ListCompletions(Transaction& t, const CompletionQuery& q) {
  auto* db = TX(t).Handle();

  std::string sql = std::string(sql::SELECT_COMPLETION_COLUMNS) + " WHERE 1=1";
  sql::Params params;
  if (q.reader_id) {
    sql += " AND reader_id=?";
    params.emplace_back(*q.reader_id);
  }
  AppendDateRange(sql, params, "completed_on", q.from, q.to);
  sql += " ORDER BY completed_at_ms, id;";

  Statement s;
  if (sqlite3_prepare_v2(db, sql.c_str(), -1, &s.st, nullptr) != SQLITE_OK) {
    throw std::runtime_error(std::string("ListCompletions prepare: ") + sqlite3_errmsg(db));
  }
  Bind(s.st, params);

  std::vector<model::CompletionRecord> out;
  int                                  rc;
  while ((rc = sqlite3_step(s.st)) == SQLITE_ROW) {
    model::CompletionRecord c;
    c.reader_id    = ColText(s.st, 0);
    c.book_id      = ColText(s.st, 1);
    c.progress_id  = ColU64(s.st, 2);
    c.completed_on = util::ParseDate(ColText(s.st, 3));
    c.completed_at = ColTime(s.st, 4);
    out.push_back(std::move(c));
  }
  if (rc != SQLITE_DONE) throw std::runtime_error(std::string("ListCompletions: ") + sqlite3_errmsg(db));
  return out;
}

} // namespace pagewise::db::sqlite
