#pragma once

namespace pagewise::db::sql {

/*
  Canonical SQL used by the relational backend.

  Decimal columns carry the fixed-point unit count (1/10000) in an INTEGER
  column suffixed with _e4. Dates are ISO-8601 TEXT so they sort correctly.
  An empty context_id is the reader's default read-through.
*/

// progress

static constexpr const char* INSERT_PROGRESS =
    "INSERT INTO progress(reader_id,book_id,context_id,percent_e4,active_formats,custom_total_pages,"
    "playback_speed_e4,current_page,state,completed_at_ms,created_at_ms,updated_at_ms,version)"
    " VALUES(?,?,?,?,?,?,?,?,?,?,?,?,?);";

static constexpr const char* SELECT_PROGRESS_COLUMNS =
    "SELECT id,reader_id,book_id,context_id,percent_e4,active_formats,custom_total_pages,"
    "playback_speed_e4,current_page,state,completed_at_ms,created_at_ms,updated_at_ms,version"
    " FROM progress";

static constexpr const char* UPDATE_PROGRESS =
    "UPDATE progress SET percent_e4=?,active_formats=?,custom_total_pages=?,playback_speed_e4=?,"
    "current_page=?,state=?,completed_at_ms=?,updated_at_ms=?,version=version+1"
    " WHERE id=? AND version=?;";

// media

static constexpr const char* UPSERT_MEDIUM =
    "INSERT INTO progress_medium(progress_id,medium,current_page,total_pages_override,"
    "position_seconds,length_seconds,playback_speed_e4)"
    " VALUES(?,?,?,?,?,?,?)"
    " ON CONFLICT(progress_id,medium) DO UPDATE SET"
    " current_page=excluded.current_page,"
    " total_pages_override=excluded.total_pages_override,"
    " position_seconds=excluded.position_seconds,"
    " length_seconds=excluded.length_seconds,"
    " playback_speed_e4=excluded.playback_speed_e4;";

static constexpr const char* SELECT_MEDIA =
    "SELECT progress_id,medium,current_page,total_pages_override,position_seconds,length_seconds,playback_speed_e4"
    " FROM progress_medium WHERE progress_id=? ORDER BY medium;";

static constexpr const char* DELETE_MEDIUM =
    "DELETE FROM progress_medium WHERE progress_id=? AND medium=?;";

// ledger

static constexpr const char* INSERT_LEDGER_ENTRY =
    "INSERT INTO reading_ledger(progress_id,reader_id,book_id,log_date,medium,pages_equivalent_e4,"
    "audio_seconds,recorded_at_ms)"
    " VALUES(?,?,?,?,?,?,?,?);";

static constexpr const char* SELECT_LEDGER_COLUMNS =
    "SELECT entry_id,progress_id,reader_id,book_id,log_date,medium,pages_equivalent_e4,audio_seconds,recorded_at_ms"
    " FROM reading_ledger";

// completions

static constexpr const char* INSERT_COMPLETION =
    "INSERT INTO book_completion(reader_id,book_id,progress_id,completed_on,completed_at_ms)"
    " VALUES(?,?,?,?,?);";

static constexpr const char* SELECT_COMPLETION_COLUMNS =
    "SELECT reader_id,book_id,progress_id,completed_on,completed_at_ms FROM book_completion";

} // namespace pagewise::db::sql
