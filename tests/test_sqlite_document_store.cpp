#include "lexcite/citation/provision_candidates.h"
#include "lexcite/storage/sqlite/sqlite_db.h"
#include "lexcite/storage/sqlite/sqlite_document_store.h"

#include <catch2/catch_test_macros.hpp>

#include "support/registry_fixture.h"
#include <filesystem>
#include <string>

using namespace lexcite;

namespace {

const core::DocumentId kAbgb{"gesetz-10001622"};
const core::DocumentId kDsg{"gesetz-10001597"};

}  // namespace

TEST_CASE("SqliteDocumentStore resolves IDs, names and title fragments", "[sqlite][storage]") {
  auto db = testing::open_fixture_db();
  REQUIRE(db != nullptr);
  storage::sqlite::SqliteDocumentStore store(db);

  CHECK(store.resolve_id("gesetz-10001622") == kAbgb);
  CHECK(store.resolve_id("abgb") == kAbgb);
  CHECK(store.resolve_id("DATENSCHUTZGESETZ") == kDsg);
  CHECK(store.resolve_id("Gesetz") == kDsg);
  CHECK_FALSE(store.resolve_id("Strafgesetzbuch").has_value());
  CHECK(store.resolve_id("ABGB\u00A0") == kAbgb);
}

TEST_CASE("SqliteDocumentStore escapes LIKE wildcards", "[sqlite][storage]") {
  auto db = testing::open_fixture_db();
  REQUIRE(db != nullptr);
  storage::sqlite::SqliteDocumentStore store(db);

  CHECK_FALSE(store.resolve_id("%").has_value());
  CHECK_FALSE(store.resolve_id("Ehe_esetz").has_value());
}

TEST_CASE("SqliteDocumentStore reads documents", "[sqlite][storage]") {
  auto db = testing::open_fixture_db();
  REQUIRE(db != nullptr);
  storage::sqlite::SqliteDocumentStore store(db);

  const auto dsg = store.get_document(kDsg);
  REQUIRE(dsg.has_value());
  CHECK(dsg->title == "Datenschutzgesetz");
  CHECK(dsg->short_name == "DSG");
  CHECK(dsg->status == "amended");
  CHECK_FALSE(dsg->issued_date.has_value());
  CHECK(dsg->in_force_date == "2018-05-25");

  CHECK_FALSE(store.get_document(core::DocumentId{"gesetz-0"}).has_value());
}

TEST_CASE("SqliteDocumentStore matches provisions through candidate keys", "[sqlite][storage]") {
  auto db = testing::open_fixture_db();
  REQUIRE(db != nullptr);
  storage::sqlite::SqliteDocumentStore store(db);

  CHECK(store.provision_exists(kAbgb, citation::build_provision_candidates("§ 1")));
  CHECK(store.provision_exists(kAbgb, citation::build_provision_candidates("16")));
  CHECK(store.provision_exists(kDsg, citation::build_provision_candidates("Paragraph 4a")));
  CHECK_FALSE(store.provision_exists(kAbgb, citation::build_provision_candidates("§ 2")));
  CHECK_FALSE(store.provision_exists(kAbgb, citation::build_provision_candidates("")));

  const auto provision = store.find_provision(kDsg, citation::build_provision_candidates("4a"));
  REQUIRE(provision.has_value());
  CHECK(provision->provision_ref == "para4a");
  CHECK(provision->chapter == "1. Abschnitt");
  CHECK_FALSE(provision->title.has_value());
  CHECK(provision->order_index == 5);
}

TEST_CASE("SqliteDocumentStore lists provisions by order_index", "[sqlite][storage]") {
  auto db = testing::open_fixture_db();
  REQUIRE(db != nullptr);
  storage::sqlite::SqliteDocumentStore store(db);

  const auto provisions = store.list_provisions(kAbgb, 10);
  REQUIRE(provisions.size() == 2);
  CHECK(provisions[0].provision_ref == "para1");
  CHECK(provisions[1].provision_ref == "para16");
  CHECK(store.list_provisions(kAbgb, 1).size() == 1);
}

TEST_CASE("SqliteDocumentStore full-text search ranks and highlights", "[sqlite][search]") {
  auto db = testing::open_fixture_db();
  REQUIRE(db != nullptr);
  storage::sqlite::SqliteDocumentStore store(db);

  const auto result = store.search("\"Datenschutzbehörde\"*", domain::SearchFilter{});
  REQUIRE(result.has_value());
  REQUIRE(result.value().size() == 1);
  const auto& hit = result.value().front();
  CHECK(hit.document_id == kDsg);
  CHECK(hit.document_title == "Datenschutzgesetz");
  CHECK(hit.provision_ref == "para4a");
  CHECK(hit.section == "§ 4a");
  CHECK(hit.snippet.find(">>>Datenschutzbehörde<<<") != std::string::npos);
  CHECK(hit.relevance > 0.0);
}

TEST_CASE("SqliteDocumentStore search applies filters", "[sqlite][search]") {
  auto db = testing::open_fixture_db();
  REQUIRE(db != nullptr);
  storage::sqlite::SqliteDocumentStore store(db);

  domain::SearchFilter unfiltered;
  const auto all = store.search("\"Die\"*", unfiltered);
  REQUIRE(all.has_value());
  CHECK(all.value().size() == 2);

  domain::SearchFilter by_status;
  by_status.status = "repealed";
  const auto repealed = store.search("\"Die\"*", by_status);
  REQUIRE(repealed.has_value());
  REQUIRE(repealed.value().size() == 1);
  CHECK(repealed.value().front().document_title == "Ehegesetz");

  domain::SearchFilter by_document;
  by_document.document_id = kDsg;
  const auto dsg = store.search("\"Die\"*", by_document);
  REQUIRE(dsg.has_value());
  REQUIRE(dsg.value().size() == 1);
  CHECK(dsg.value().front().provision_ref == "para4a");

  domain::SearchFilter limited;
  limited.limit = 1;
  const auto one = store.search("\"Die\"*", limited);
  REQUIRE(one.has_value());
  CHECK(one.value().size() == 1);
}

TEST_CASE("SqliteDocumentStore search reports malformed expressions", "[sqlite][search]") {
  auto db = testing::open_fixture_db();
  REQUIRE(db != nullptr);
  storage::sqlite::SqliteDocumentStore store(db);

  const auto result = store.search("\"unbalanced", domain::SearchFilter{});
  REQUIRE_FALSE(result.has_value());
  CHECK_FALSE(result.error().empty());
}

TEST_CASE("SqliteDb reports a missing database as an error", "[sqlite]") {
  const auto result = storage::sqlite::SqliteDb::open("/nonexistent/dir/registry.db");
  REQUIRE_FALSE(result.has_value());
  CHECK_FALSE(result.error().empty());
}

TEST_CASE("SqliteDb opens registries read-only unless asked to write", "[sqlite]") {
  const std::filesystem::path tmp_dir =
      std::filesystem::temp_directory_path() / "lexcite_test_open_mode";
  std::filesystem::create_directories(tmp_dir);
  const std::string db_path = (tmp_dir / "registry.db").string();
  std::filesystem::remove(db_path);

  // Write scope: kReadWrite creates the file and accepts the schema.
  {
    auto result = storage::sqlite::SqliteDb::open(db_path, storage::sqlite::OpenMode::kReadWrite);
    REQUIRE(result.has_value());
    REQUIRE(result.value()->exec("CREATE TABLE legal_documents (id TEXT PRIMARY KEY)").has_value());
  }

  // Read scope: the default mode sees the table but rejects writes.
  {
    auto result = storage::sqlite::SqliteDb::open(db_path);
    REQUIRE(result.has_value());
    auto db = result.value();
    CHECK(db->has_table("legal_documents"));
    const auto insert = db->exec("INSERT INTO legal_documents VALUES ('gesetz-1')");
    REQUIRE_FALSE(insert.has_value());
    CHECK(insert.error().find("readonly") != std::string::npos);
  }

  std::filesystem::remove_all(tmp_dir);
}
