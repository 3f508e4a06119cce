#pragma once

#include <sqlite3.h>

#include <mutex>
#include <string>

namespace pagewise::db::sqlite {

/*
  Thin RAII wrapper around sqlite3*.

  A single connection is shared by every transaction. SQLite does not nest
  BEGIN on one connection, so transactions serialize on TxMutex().
*/
class SqliteDB {
 public:
  explicit SqliteDB(std::string path);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  const std::string& Path() const {
    return path_;
  }

  std::mutex& TxMutex() {
    return tx_mutex_;
  }

  // Execute a SQL string (used for pragmas/migrations)
  void Exec(const std::string& sql);

  // Prepare a statement (caller must sqlite3_finalize)
  sqlite3_stmt* Prepare(const std::string& sql);

  // Configure recommended PRAGMAs (WAL, foreign keys, etc.)
  void Configure(bool wal);

  // Creates the progress / ledger tables if missing.
  void Migrate();

 private:
  sqlite3*    db_ = nullptr;
  std::string path_;
  std::mutex  tx_mutex_;
};

} // namespace pagewise::db::sqlite
