#include "lexcite/app/registry_info.h"
#include "lexcite/core/version.h"
#include "lexcite/storage/sqlite/sqlite_registry_metadata.h"

#include <catch2/catch_test_macros.hpp>

#include "support/registry_fixture.h"
#include <string>
#include <vector>

using namespace lexcite;

TEST_CASE("list_sources reports provenance and registry metadata", "[app][registry]") {
  auto db = testing::open_eu_fixture_db();
  REQUIRE(db != nullptr);
  storage::sqlite::SqliteRegistryMetadata metadata(db);

  const auto report = app::list_sources(metadata);

  REQUIRE(report.sources.size() == 1);
  CHECK(report.sources[0].name == "RIS OGD");
  CHECK(report.sources[0].official_portal == "https://www.ris.bka.gv.at");
  CHECK(report.sources[0].languages == std::vector<std::string>{"de"});

  const auto& database = report.database;
  CHECK(database.tier == "test");
  CHECK(database.schema_version == "1.0");
  CHECK(database.jurisdiction == "AT");
  CHECK(database.built_at == "2025-01-01T00:00:00Z");
  CHECK(database.counts.documents == 3);
  CHECK(database.counts.provisions == 4);
  CHECK(database.counts.eu_documents == 4);
  CHECK(database.counts.eu_references == 5);

  const auto json = app::sources_report_to_json(report);
  CHECK(json["database"]["eu_reference_count"] == 5);
  CHECK(json["sources"][0]["license"] == "CC BY 4.0");
}

TEST_CASE("list_sources falls back to defaults on an empty database", "[app][registry]") {
  auto db = testing::open_memory_db({});
  REQUIRE(db != nullptr);
  storage::sqlite::SqliteRegistryMetadata metadata(db);

  const auto report = app::list_sources(metadata);

  CHECK(report.database.tier == "free");
  CHECK(report.database.schema_version == "unknown");
  CHECK(report.database.jurisdiction == "AT");
  CHECK_FALSE(report.database.built_at.has_value());
  CHECK(report.database.counts.documents == 0);
  CHECK(report.database.counts.eu_references == 0);
  CHECK(app::sources_report_to_json(report)["database"]["built_at"].is_null());
}

TEST_CASE("list_sources treats NULL metadata values as absent", "[app][registry]") {
  auto db = testing::open_memory_db(
      {"CREATE TABLE db_metadata (key TEXT PRIMARY KEY, value TEXT);"
       "INSERT INTO db_metadata VALUES ('tier', NULL), ('schema_version', '2');"});
  REQUIRE(db != nullptr);
  storage::sqlite::SqliteRegistryMetadata metadata(db);

  const auto report = app::list_sources(metadata);

  CHECK(report.database.tier == "free");
  CHECK(report.database.schema_version == "2");
}

TEST_CASE("about describes the tool and the dataset", "[app][registry]") {
  auto db = testing::open_eu_fixture_db();
  REQUIRE(db != nullptr);
  storage::sqlite::SqliteRegistryMetadata metadata(db);

  const auto report = app::about(metadata);

  CHECK(report.name == "lexcite");
  CHECK(report.version == core::kBuildVersion);
  CHECK(report.dataset_built == "2025-01-01T00:00:00Z");
  CHECK(report.jurisdiction == "Austria (AT)");
  CHECK(report.counts.provisions == 4);
  CHECK(report.access_model == "read-only");

  const auto json = app::about_report_to_json(report);
  CHECK(json["dataset"]["counts"]["eu_documents"] == 4);
  CHECK(json["security"]["access_model"] == "read-only");

  auto empty_db = testing::open_memory_db({});
  REQUIRE(empty_db != nullptr);
  storage::sqlite::SqliteRegistryMetadata empty_metadata(empty_db);
  CHECK(app::about(empty_metadata).dataset_built == "unknown");
}
