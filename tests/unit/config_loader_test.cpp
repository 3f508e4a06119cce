#include "internal/config/config_loader.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

#include "internal/factory.hpp"

namespace {

using pagewise::config::ConfigLoader;
using pagewise::runtime::config::DatabaseConfig;

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "pagewise_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

void ExpectInvalid(const std::string& yaml) {
  bool threw = false;
  try {
    ConfigLoader::LoadFromYamlString(yaml);
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

void TestFullConfigFromFile() {
  const auto yaml_path = WriteYaml("full",
                                   R"(logging:
  level: debug
  pattern: "[%l] %v"
database:
  backend: BACKEND_SQLITE
  sqlite:
    path: "/var/lib/pagewise/progress.db"
    wal: true
engine:
  default_playback_speed: "1.25"
  utc_offset_minutes: -300
catalog:
  books:
    - book_id: dune
      total_pages: 412
    - book_id: "0451524934"
      total_pages: 328
)");

  auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.logging().level() == "debug");
  assert(config.logging().pattern() == "[%l] %v");
  assert(config.database().backend() == DatabaseConfig::BACKEND_SQLITE);
  assert(config.database().sqlite().path() == "/var/lib/pagewise/progress.db");
  assert(config.database().sqlite().wal());
  assert(config.engine().default_playback_speed() == "1.25");
  assert(config.engine().utc_offset_minutes() == -300);
  assert(config.catalog().books_size() == 2);
  assert(config.catalog().books(0).total_pages() == 412);
  // Quoted numeric ids stay strings.
  assert(config.catalog().books(1).book_id() == "0451524934");

  const auto options = pagewise::factory::BuildEngineOptions(config);
  assert(options.default_playback_speed == pagewise::util::Decimal::Parse("1.25"));
  assert(options.utc_offset == std::chrono::minutes(-300));
}

void TestEmptyConfigUsesDefaults() {
  auto config = ConfigLoader::LoadFromYamlString("");
  assert(config.database().backend() == DatabaseConfig::BACKEND_MEMORY);
  assert(config.engine().default_playback_speed() == "1.0");
  assert(config.engine().utc_offset_minutes() == 0);
  assert(config.catalog().books_size() == 0);

  auto deps = pagewise::factory::Build(config);
  assert(deps.engine);
  assert(deps.aggregator);
  assert(deps.catalog->Size() == 0);
}

void TestCatalogSeedsFactory() {
  auto config = ConfigLoader::LoadFromYamlString(R"(catalog:
  books:
    - book_id: dune
      total_pages: 300
    - book_id: untold
      total_pages: 0
)");
  auto deps = pagewise::factory::Build(config);
  assert(deps.catalog->Size() == 2);
  assert(*deps.catalog->GetEffectiveTotalPages("dune") == 300);
  assert(!deps.catalog->GetEffectiveTotalPages("untold"));
}

void TestSqliteFactoryMigrates() {
  auto config = ConfigLoader::LoadFromYamlString(R"(database:
  backend: BACKEND_SQLITE
  sqlite:
    path: ":memory:"
catalog:
  books:
    - book_id: dune
      total_pages: 300
)");
  auto deps = pagewise::factory::Build(config);
  const auto now      = pagewise::util::Now();
  auto       snapshot = deps.engine->ReportProgress({"ana", "dune", ""}, pagewise::model::Medium::kPaper, 30, now);
  assert(snapshot.ledger_delta == pagewise::util::Decimal::FromInteger(30));
  assert(deps.engine->GetProgress({"ana", "dune", ""})->progress_id == snapshot.progress_id);
}

void TestUnknownFieldsAreRejected() {
  ExpectInvalid(R"(engine:
  default_playback_speed: "1.0"
unknown_field: 123
)");
  ExpectInvalid(R"(database:
  backend: BACKEND_POSTGRES
)");
}

void TestValidationRules() {
  // sqlite needs a path
  ExpectInvalid(R"(database:
  backend: BACKEND_SQLITE
)");
  // unquoted decimals are numbers, not strings
  ExpectInvalid(R"(engine:
  default_playback_speed: 1.5
)");
  ExpectInvalid(R"(engine:
  default_playback_speed: "3.5"
)");
  ExpectInvalid(R"(engine:
  default_playback_speed: "fast"
)");
  ExpectInvalid(R"(engine:
  utc_offset_minutes: 900
)");
  ExpectInvalid(R"(catalog:
  books:
    - total_pages: 10
)");
  ExpectInvalid(R"(catalog:
  books:
    - book_id: dune
      total_pages: -4
)");
  ExpectInvalid(R"(catalog:
  books:
    - book_id: dune
      total_pages: 300
    - book_id: dune
      total_pages: 310
)");
}

void TestMissingFileFails() {
  bool threw = false;
  try {
    ConfigLoader::LoadFromYaml("/nonexistent/pagewise.yaml");
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestFullConfigFromFile();
  TestEmptyConfigUsesDefaults();
  TestCatalogSeedsFactory();
  TestSqliteFactoryMigrates();
  TestUnknownFieldsAreRejected();
  TestValidationRules();
  TestMissingFileFails();

  std::cout << "pagewise_unit_config_loader: pass\n";
  return 0;
}
