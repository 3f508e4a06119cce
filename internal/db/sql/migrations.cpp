#include "migrations.hpp"

namespace pagewise::db::sql {

const std::vector<std::string>& SchemaStatements() {
  static const std::vector<std::string> kSchema = {
      "CREATE TABLE IF NOT EXISTS progress ("
      " id INTEGER PRIMARY KEY AUTOINCREMENT,"
      " reader_id TEXT NOT NULL,"
      " book_id TEXT NOT NULL,"
      " context_id TEXT NOT NULL DEFAULT '',"
      " percent_e4 INTEGER NOT NULL CHECK (percent_e4 BETWEEN 0 AND 1000000),"
      " active_formats TEXT NOT NULL CHECK (active_formats <> ''),"
      " custom_total_pages INTEGER,"
      " playback_speed_e4 INTEGER NOT NULL,"
      " current_page INTEGER,"
      " state INTEGER NOT NULL,"
      " completed_at_ms INTEGER,"
      " created_at_ms INTEGER NOT NULL,"
      " updated_at_ms INTEGER NOT NULL,"
      " version INTEGER NOT NULL,"
      " UNIQUE (reader_id, book_id, context_id));",

      "CREATE TABLE IF NOT EXISTS progress_medium ("
      " progress_id INTEGER NOT NULL REFERENCES progress(id) ON DELETE CASCADE,"
      " medium INTEGER NOT NULL,"
      " current_page INTEGER NOT NULL DEFAULT 0 CHECK (current_page >= 0),"
      " total_pages_override INTEGER,"
      " position_seconds INTEGER NOT NULL DEFAULT 0 CHECK (position_seconds >= 0),"
      " length_seconds INTEGER,"
      " playback_speed_e4 INTEGER,"
      " PRIMARY KEY (progress_id, medium));",

      "CREATE TABLE IF NOT EXISTS reading_ledger ("
      " entry_id INTEGER PRIMARY KEY AUTOINCREMENT,"
      " progress_id INTEGER NOT NULL REFERENCES progress(id),"
      " reader_id TEXT NOT NULL,"
      " book_id TEXT NOT NULL,"
      " log_date TEXT NOT NULL,"
      " medium INTEGER NOT NULL,"
      " pages_equivalent_e4 INTEGER NOT NULL CHECK (pages_equivalent_e4 >= 0),"
      " audio_seconds INTEGER NOT NULL DEFAULT 0 CHECK (audio_seconds >= 0),"
      " recorded_at_ms INTEGER NOT NULL);",

      "CREATE INDEX IF NOT EXISTS reading_ledger_reader_date ON reading_ledger(reader_id, log_date);",
      "CREATE INDEX IF NOT EXISTS reading_ledger_progress ON reading_ledger(progress_id);",

      "CREATE TRIGGER IF NOT EXISTS reading_ledger_no_update BEFORE UPDATE ON reading_ledger"
      " BEGIN SELECT RAISE(ABORT, 'reading ledger is append-only'); END;",
      "CREATE TRIGGER IF NOT EXISTS reading_ledger_no_delete BEFORE DELETE ON reading_ledger"
      " BEGIN SELECT RAISE(ABORT, 'reading ledger is append-only'); END;",

      "CREATE TABLE IF NOT EXISTS book_completion ("
      " id INTEGER PRIMARY KEY AUTOINCREMENT,"
      " reader_id TEXT NOT NULL,"
      " book_id TEXT NOT NULL,"
      " progress_id INTEGER NOT NULL,"
      " completed_on TEXT NOT NULL,"
      " completed_at_ms INTEGER NOT NULL);",

      "CREATE INDEX IF NOT EXISTS book_completion_reader_date ON book_completion(reader_id, completed_on);",

      "CREATE TABLE IF NOT EXISTS schema_migrations (version INTEGER PRIMARY KEY, applied_at_ms INTEGER NOT NULL);",
  };
  return kSchema;
}

void RunMigrations(MigrationExecutor& executor, const std::vector<std::string>& ordered_sql) {
  for (const auto& sql : ordered_sql) {
    executor.ExecuteSQL(sql);
  }
}

} // namespace pagewise::db::sql
