#include "lexcite/app/legal_lookup.h"
#include "lexcite/storage/inmemory_document_store.h"
#include "lexcite/storage/sqlite/sqlite_document_store.h"

#include <catch2/catch_test_macros.hpp>

#include "support/registry_fixture.h"
#include <map>
#include <string>
#include <vector>

using namespace lexcite;

namespace {

// ScriptedSearchIndex answers each FTS expression from a table and records
// what it was asked.
class ScriptedSearchIndex final : public storage::IProvisionSearchIndex {
 public:
  using SearchResult = core::Result<std::vector<domain::SearchHit>, std::string>;

  void respond(const std::string& expression, SearchResult result) {
    responses_.insert_or_assign(expression, std::move(result));
  }

  [[nodiscard]] SearchResult search(const std::string& fts_expression,
                                    const domain::SearchFilter& filter) const override {
    expressions.push_back(fts_expression);
    filters.push_back(filter);
    auto it = responses_.find(fts_expression);
    if (it == responses_.end()) {
      return SearchResult::ok({});
    }
    return it->second;
  }

  mutable std::vector<std::string> expressions;
  mutable std::vector<domain::SearchFilter> filters;

 private:
  std::map<std::string, SearchResult> responses_;
};

domain::SearchHit make_hit(const std::string& provision_ref) {
  return {core::DocumentId{"gesetz-10001622"}, "Allgemeines bürgerliches Gesetzbuch",
          provision_ref, "§ 1", ">>>Recht<<<", 1.5};
}

}  // namespace

TEST_CASE("get_provision returns one cleaned provision", "[app][lookup]") {
  storage::InMemoryDocumentStore store;
  testing::seed_registry(store);

  const auto result = app::get_provision(store, {"ABGB", std::string{"§ 1"}, std::nullopt});
  REQUIRE(result.has_value());
  const auto& lookup = result.value();
  CHECK(lookup.specific);
  REQUIRE(lookup.provisions.size() == 1);
  const auto& view = lookup.provisions.front();
  CHECK(view.document_id.value == "gesetz-10001622");
  CHECK(view.document_title == "Allgemeines bürgerliches Gesetzbuch");
  CHECK(view.document_status == "in_force");
  CHECK(view.provision_ref == "para1");
  CHECK(view.title == "Begriff des bürgerlichen Rechtes");
  CHECK(view.content == "Der Inbegriff der Gesetze macht das bürgerliche Recht aus.");
}

TEST_CASE("get_provision prefers provision_ref over section", "[app][lookup]") {
  storage::InMemoryDocumentStore store;
  testing::seed_registry(store);

  const auto result =
      app::get_provision(store, {"gesetz-10001622", std::string{"1"}, std::string{"para16"}});
  REQUIRE(result.has_value());
  REQUIRE(result.value().provisions.size() == 1);
  CHECK(result.value().provisions.front().provision_ref == "para16");
}

TEST_CASE("get_provision reports a missing provision as no result", "[app][lookup]") {
  storage::InMemoryDocumentStore store;
  testing::seed_registry(store);

  const auto result = app::get_provision(store, {"ABGB", std::string{"§ 999"}, std::nullopt});
  REQUIRE(result.has_value());
  CHECK(result.value().specific);
  CHECK(result.value().provisions.empty());

  const auto json = app::provision_lookup_to_json(result.value());
  CHECK(json.at("result").is_null());
}

TEST_CASE("get_provision lists a whole document", "[app][lookup]") {
  storage::InMemoryDocumentStore store;
  testing::seed_registry(store);

  const auto result = app::get_provision(store, {"ABGB", std::nullopt, std::nullopt});
  REQUIRE(result.has_value());
  CHECK_FALSE(result.value().specific);
  CHECK_FALSE(result.value().truncated);
  REQUIRE(result.value().provisions.size() == 2);
  CHECK(result.value().provisions[1].provision_ref == "para16");
}

TEST_CASE("get_provision caps whole documents", "[app][lookup]") {
  storage::InMemoryDocumentStore store;
  const core::DocumentId id{"gesetz-20000000"};
  store.upsert_document({id, "Großes Gesetz", std::nullopt, domain::kStatusInForce, "statute",
                         std::nullopt, std::nullopt});
  for (int i = 1; i <= 205; ++i) {
    const std::string number = std::to_string(i);
    store.upsert_provision({id, "para" + number, std::nullopt, "§ " + number, std::nullopt,
                            "Inhalt " + number + ".", i});
  }

  const auto result = app::get_provision(store, {"gesetz-20000000", std::nullopt, std::nullopt});
  REQUIRE(result.has_value());
  CHECK(result.value().provisions.size() == app::kMaxProvisionsPerDocument);
  CHECK(result.value().truncated);
  CHECK(result.value().truncation_hint.has_value());
  CHECK(result.value().provisions.back().provision_ref == "para200");
}

TEST_CASE("get_provision tolerates unknown documents and rejects empty IDs", "[app][lookup]") {
  storage::InMemoryDocumentStore store;
  testing::seed_registry(store);

  const auto unknown = app::get_provision(store, {"gesetz-0", std::nullopt, std::nullopt});
  REQUIRE(unknown.has_value());
  CHECK(unknown.value().provisions.empty());

  CHECK_FALSE(app::get_provision(store, {"  ", std::nullopt, std::nullopt}).has_value());
}

TEST_CASE("check_currency reports in-force and repealed statutes", "[app][currency]") {
  storage::InMemoryDocumentStore store;
  testing::seed_registry(store);

  const auto abgb = app::check_currency(store, {"ABGB", std::nullopt});
  REQUIRE(abgb.has_value());
  REQUIRE(abgb.value().has_value());
  CHECK(abgb.value()->is_current);
  CHECK(abgb.value()->issued_date == "1811-06-01");
  CHECK_FALSE(abgb.value()->provision_exists.has_value());
  CHECK(abgb.value()->warnings.empty());

  const auto ehe = app::check_currency(store, {"Ehegesetz", std::nullopt});
  REQUIRE(ehe.has_value());
  REQUIRE(ehe.value().has_value());
  CHECK_FALSE(ehe.value()->is_current);
  CHECK(ehe.value()->warnings == std::vector<std::string>{"This statute has been repealed"});
}

TEST_CASE("check_currency checks an optional provision", "[app][currency]") {
  storage::InMemoryDocumentStore store;
  testing::seed_registry(store);

  const auto dsg = app::check_currency(store, {"DSG", std::string{"§ 4a"}});
  REQUIRE(dsg.has_value());
  REQUIRE(dsg.value().has_value());
  CHECK_FALSE(dsg.value()->is_current);
  CHECK(dsg.value()->status == "amended");
  CHECK(dsg.value()->provision_exists == true);
  CHECK(dsg.value()->warnings.empty());

  const auto missing = app::check_currency(store, {"ABGB", std::string{"§ 99"}});
  REQUIRE(missing.has_value());
  REQUIRE(missing.value().has_value());
  CHECK(missing.value()->provision_exists == false);
  CHECK(missing.value()->warnings ==
        std::vector<std::string>{"Provision \"§ 99\" not found in this document"});
}

TEST_CASE("check_currency returns nothing for unknown documents", "[app][currency]") {
  storage::InMemoryDocumentStore store;
  testing::seed_registry(store);

  const auto result = app::check_currency(store, {"Strafgesetzbuch", std::nullopt});
  REQUIRE(result.has_value());
  CHECK_FALSE(result.value().has_value());
  CHECK_FALSE(app::check_currency(store, {"", std::nullopt}).has_value());
}

TEST_CASE("check_currency validates as_of_date", "[app][currency]") {
  storage::InMemoryDocumentStore store;
  testing::seed_registry(store);

  for (const std::string date : {"2024-13-01", "2023-02-29", "2024-1-5", "01.01.2024",
                                 "2024-01-01T00:00", "heute"}) {
    INFO(date);
    const auto result = app::check_currency(store, {"ABGB", std::nullopt, date});
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error() == "as_of_date must be an ISO date (YYYY-MM-DD)");
  }

  // Validation runs before the document lookup.
  CHECK_FALSE(
      app::check_currency(store, {"Strafgesetzbuch", std::nullopt, std::string{"x"}}).has_value());
}

TEST_CASE("check_currency notes that as_of_date reports the current version", "[app][currency]") {
  storage::InMemoryDocumentStore store;
  testing::seed_registry(store);

  const auto leap_day =
      app::check_currency(store, {"ABGB", std::nullopt, std::string{"2024-02-29"}});
  REQUIRE(leap_day.has_value());
  REQUIRE(leap_day.value().has_value());
  const auto& report = *leap_day.value();
  CHECK(report.is_current);
  REQUIRE(report.warnings.size() == 1);
  CHECK(report.warnings[0].find("as of 2024-02-29") != std::string::npos);

  const auto blank = app::check_currency(store, {"ABGB", std::nullopt, std::string{" "}});
  REQUIRE(blank.has_value());
  CHECK(blank.value()->warnings.empty());
}

TEST_CASE("search_legislation returns primary hits", "[app][search]") {
  storage::InMemoryDocumentStore store;
  testing::seed_registry(store);
  ScriptedSearchIndex index;
  index.respond("\"Recht\"*", ScriptedSearchIndex::SearchResult::ok({make_hit("para1")}));

  app::SearchRequest request;
  request.query = "Recht";
  const auto result = app::search_legislation(index, store, request);

  REQUIRE(result.has_value());
  CHECK_FALSE(result.value().used_fallback);
  CHECK(result.value().executed_query == "\"Recht\"*");
  CHECK(result.value().hits.size() == 1);
  CHECK(index.expressions.size() == 1);
  CHECK(index.filters.front().limit == app::kDefaultSearchLimit);
}

TEST_CASE("search_legislation falls back when the primary finds nothing", "[app][search]") {
  storage::InMemoryDocumentStore store;
  testing::seed_registry(store);
  ScriptedSearchIndex index;
  index.respond("\"Recht\"* OR \"Pflicht\"*",
                ScriptedSearchIndex::SearchResult::ok({make_hit("para1"), make_hit("para16")}));

  app::SearchRequest request;
  request.query = "Recht Pflicht";
  const auto result = app::search_legislation(index, store, request);

  REQUIRE(result.has_value());
  CHECK(result.value().used_fallback);
  CHECK(result.value().hits.size() == 2);
  CHECK(index.expressions ==
        std::vector<std::string>{"\"Recht\"* \"Pflicht\"*", "\"Recht\"* OR \"Pflicht\"*"});
}

TEST_CASE("search_legislation falls back when the primary is rejected", "[app][search]") {
  storage::InMemoryDocumentStore store;
  testing::seed_registry(store);
  ScriptedSearchIndex index;
  index.respond("\"Recht AND", ScriptedSearchIndex::SearchResult::err("fts5: syntax error"));
  index.respond("\"Recht\"* OR \"AND\"*",
                ScriptedSearchIndex::SearchResult::ok({make_hit("para1")}));

  app::SearchRequest request;
  request.query = "\"Recht AND";
  const auto result = app::search_legislation(index, store, request);

  REQUIRE(result.has_value());
  CHECK(result.value().used_fallback);
  CHECK(result.value().hits.size() == 1);
}

TEST_CASE("search_legislation surfaces an error without a fallback", "[app][search]") {
  storage::InMemoryDocumentStore store;
  ScriptedSearchIndex index;
  index.respond("\"(", ScriptedSearchIndex::SearchResult::err("fts5: syntax error"));

  app::SearchRequest request;
  request.query = "\"(";
  const auto result = app::search_legislation(index, store, request);

  REQUIRE_FALSE(result.has_value());
  CHECK(result.error().find("fts5: syntax error") != std::string::npos);
}

TEST_CASE("search_legislation validates and normalizes its request", "[app][search]") {
  storage::InMemoryDocumentStore store;
  testing::seed_registry(store);
  ScriptedSearchIndex index;

  app::SearchRequest empty;
  empty.query = "   ";
  CHECK_FALSE(app::search_legislation(index, store, empty).has_value());

  app::SearchRequest bad_status;
  bad_status.query = "Recht";
  bad_status.status = "draft";
  CHECK_FALSE(app::search_legislation(index, store, bad_status).has_value());
  CHECK(index.expressions.empty());

  app::SearchRequest request;
  request.query = "Recht";
  request.document_id = "ABGB";
  request.status = "in_force";
  request.limit = 500;
  REQUIRE(app::search_legislation(index, store, request).has_value());
  const auto& filter = index.filters.front();
  CHECK(filter.limit == app::kMaxSearchLimit);
  CHECK(filter.document_id == core::DocumentId{"gesetz-10001622"});
  CHECK(filter.status == "in_force");

  request.limit = 0;
  REQUIRE(app::search_legislation(index, store, request).has_value());
  CHECK(index.filters.back().limit == 1);
}

TEST_CASE("search_legislation runs against the SQLite registry", "[app][search][sqlite]") {
  auto db = testing::open_fixture_db();
  REQUIRE(db != nullptr);
  storage::sqlite::SqliteDocumentStore store(db);

  app::SearchRequest request;
  request.query = "\"Datenschutzbehörde";
  const auto result = app::search_legislation(store, store, request);

  REQUIRE(result.has_value());
  CHECK(result.value().used_fallback);
  CHECK(result.value().executed_query == "\"Datenschutzbehörde\"*");
  REQUIRE(result.value().hits.size() == 1);
  CHECK(result.value().hits.front().provision_ref == "para4a");
}
