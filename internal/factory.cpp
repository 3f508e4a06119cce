#include "factory.hpp"

#include <memory>
#include <stdexcept>
#include <string>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#include "internal/observability/logging.hpp"

namespace pagewise::factory {

using pagewise::runtime::config::DatabaseConfig;
using pagewise::runtime::config::RuntimeConfig;

namespace {

std::shared_ptr<db::Repository> BuildRepository(const RuntimeConfig& config) {
  const auto& database = config.database();
  switch (database.backend()) {
    case DatabaseConfig::BACKEND_SQLITE: {
      auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path());
      sqlite_db->Configure(database.sqlite().wal());
      sqlite_db->Migrate();
      PAGEWISE_LOG_INFO("sqlite repository ready", {observability::StringField("path", database.sqlite().path()),
                                                    observability::BoolField("wal", database.sqlite().wal())});
      return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
    }
    case DatabaseConfig::BACKEND_MEMORY:
    case DatabaseConfig::BACKEND_UNSPECIFIED:
      return std::make_shared<db::memory::MemoryRepository>();
    default:
      throw std::runtime_error("unsupported database backend " + std::to_string(static_cast<int>(database.backend())));
  }
}

std::shared_ptr<catalog::MemoryCatalog> BuildCatalog(const RuntimeConfig& config) {
  auto catalog = std::make_shared<catalog::MemoryCatalog>();
  for (const auto& book : config.catalog().books()) {
    std::optional<std::int64_t> pages;
    if (book.total_pages() > 0) pages = book.total_pages();
    catalog->Put(book.book_id(), pages);
  }
  return catalog;
}

} // namespace

core::EngineOptions BuildEngineOptions(const RuntimeConfig& config) {
  core::EngineOptions options;
  if (!config.engine().default_playback_speed().empty()) {
    options.default_playback_speed = util::Decimal::Parse(config.engine().default_playback_speed());
  }
  options.utc_offset = std::chrono::minutes(config.engine().utc_offset_minutes());
  return options;
}

/*
    Build full engine dependency graph
*/
RuntimeDependencies Build(const RuntimeConfig& config) {
  RuntimeDependencies deps;

  deps.repository = BuildRepository(config);
  deps.catalog    = BuildCatalog(config);
  deps.events     = std::make_shared<events::EventBus>();

  deps.engine     = std::make_shared<core::ProgressEngine>(deps.repository, deps.catalog, deps.events, BuildEngineOptions(config));
  deps.aggregator = std::make_shared<stats::Aggregator>(deps.repository, deps.catalog);

  PAGEWISE_LOG_INFO("pagewise runtime built", {observability::IntField("catalog_books", static_cast<std::int64_t>(deps.catalog->Size())),
                                               observability::IntField("utc_offset_minutes", config.engine().utc_offset_minutes())});
  return deps;
}

} // namespace pagewise::factory
