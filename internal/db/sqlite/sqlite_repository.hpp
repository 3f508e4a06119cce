#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace pagewise::db::sqlite {

class SqliteRepository final : public db::Repository {
 public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

  std::unique_ptr<Transaction> Begin() override;

  Result                               InsertProgress(Transaction&, model::ProgressRecord&) override;
  std::optional<model::ProgressRecord> GetProgress(Transaction&, const model::ProgressKey&) override;
  std::optional<model::ProgressRecord> GetProgressById(Transaction&, std::uint64_t) override;
  std::vector<model::ProgressRecord>   ListProgress(Transaction&, const std::string&) override;
  Result                               UpdateProgress(Transaction&, model::ProgressRecord&) override;

  Result                          UpsertMedium(Transaction&, const model::MediumState&) override;
  std::vector<model::MediumState> ListMedia(Transaction&, std::uint64_t) override;
  Result                          DeleteMedium(Transaction&, std::uint64_t, model::Medium) override;

  Result                          AppendLedgerEntries(Transaction&, std::vector<model::LedgerEntry>&) override;
  std::vector<model::LedgerEntry> ReadLedger(Transaction&, const LedgerQuery&) override;

  Result                               InsertCompletion(Transaction&, const model::CompletionRecord&) override;
  std::vector<model::CompletionRecord> ListCompletions(Transaction&, const CompletionQuery&) override;

 private:
  std::shared_ptr<SqliteDB> db_;

  static SqliteTransaction& TX(Transaction& t);
  static Result             Translate(sqlite3* db, int rc);
};

} // namespace pagewise::db::sqlite
