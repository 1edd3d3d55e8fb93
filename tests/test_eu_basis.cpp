#include "lexcite/app/eu_basis.h"
#include "lexcite/storage/sqlite/sqlite_document_store.h"
#include "lexcite/storage/sqlite/sqlite_eu_reference_store.h"

#include <catch2/catch_test_macros.hpp>

#include "support/registry_fixture.h"
#include <memory>
#include <string>
#include <utility>
#include <vector>

using namespace lexcite;

namespace {

// EuRegistry holds the document and EU stores over one seeded database.
struct EuRegistry {
  std::shared_ptr<storage::sqlite::SqliteDb> db = testing::open_eu_fixture_db();
  storage::sqlite::SqliteDocumentStore documents{db};
  storage::sqlite::SqliteEuReferenceStore eu{db};
};

std::vector<std::string> summary_ids(const std::vector<app::EuImplementationSummary>& summaries) {
  std::vector<std::string> ids;
  for (const auto& summary : summaries) {
    ids.push_back(summary.eu_document.id);
  }
  return ids;
}

}  // namespace

TEST_CASE("get_eu_basis groups references per EU document", "[app][eu]") {
  EuRegistry registry;
  REQUIRE(registry.db != nullptr);

  const auto result =
      app::get_eu_basis(registry.documents, registry.eu, {"DSG", true, {}});
  REQUIRE(result.has_value());
  const auto& report = result.value();

  CHECK(report.document_id.value == "gesetz-10001597");
  CHECK(report.document_title == "Datenschutzgesetz");
  REQUIRE(report.eu_documents.size() == 2);
  CHECK(report.eu_documents[0].eu_document.id == "directive:2016/1148");
  CHECK_FALSE(report.eu_documents[0].is_primary_implementation);
  CHECK(report.eu_documents[0].articles.empty());
  CHECK(report.eu_documents[1].eu_document.id == "regulation:2016/679");
  CHECK(report.eu_documents[1].reference_type == "implements");
  CHECK(report.eu_documents[1].is_primary_implementation);
  CHECK(report.eu_documents[1].articles == std::vector<std::string>{"Art. 6", "Art. 51"});
  CHECK(report.total_eu_references == 3);
  CHECK(report.directive_count == 1);
  CHECK(report.regulation_count == 1);

  const auto json = app::eu_basis_report_to_json(report);
  CHECK(json["statistics"]["total_eu_references"] == 3);
  CHECK(json["eu_documents"][1]["articles"].size() == 2);
}

TEST_CASE("get_eu_basis filters by reference type", "[app][eu]") {
  EuRegistry registry;
  REQUIRE(registry.db != nullptr);

  const auto result =
      app::get_eu_basis(registry.documents, registry.eu, {"DSG", false, {"implements"}});
  REQUIRE(result.has_value());
  const auto& report = result.value();

  REQUIRE(report.eu_documents.size() == 1);
  CHECK(report.eu_documents[0].eu_document.short_name == "GDPR");
  CHECK(report.total_eu_references == 2);
  CHECK(report.directive_count == 0);
  CHECK_FALSE(app::eu_basis_report_to_json(report)["eu_documents"][0].contains("articles"));
}

TEST_CASE("get_eu_basis reports missing documents", "[app][eu]") {
  EuRegistry registry;
  REQUIRE(registry.db != nullptr);

  const auto missing = app::get_eu_basis(registry.documents, registry.eu, {"StGB", false, {}});
  REQUIRE_FALSE(missing.has_value());
  CHECK(missing.error() == "Document \"StGB\" not found in database");

  const auto blank = app::get_eu_basis(registry.documents, registry.eu, {" ", false, {}});
  REQUIRE_FALSE(blank.has_value());
  CHECK(blank.error() == "document_id is required");
}

TEST_CASE("get_provision_eu_basis lists the references of one provision", "[app][eu]") {
  EuRegistry registry;
  REQUIRE(registry.db != nullptr);

  const auto result =
      app::get_provision_eu_basis(registry.documents, registry.eu, {"DSG", "§ 4a"});
  REQUIRE(result.has_value());
  const auto& basis = result.value();

  CHECK(basis.document_id.value == "gesetz-10001597");
  CHECK(basis.provision_ref == "§ 4a");
  CHECK(basis.provision_content == "Die Datenschutzbehörde ist zuständig.");
  REQUIRE(basis.eu_references.size() == 1);

  const auto json = app::provision_eu_basis_to_json(basis);
  const auto& reference = json["eu_references"][0];
  CHECK(reference["id"] == "regulation:2016/679");
  CHECK(reference["short_name"] == "GDPR");
  CHECK(reference["article"] == "Art. 6");
  CHECK(reference["reference_type"] == "implements");
  CHECK(reference["is_primary_implementation"] == true);
  CHECK(reference["full_citation"] == "Verordnung (EU) 2016/679");
  CHECK(reference["context"] == "Rechtmäßigkeit der Verarbeitung");
}

TEST_CASE("get_provision_eu_basis omits absent fields of sparse rows", "[app][eu]") {
  EuRegistry registry;
  REQUIRE(registry.db != nullptr);

  const auto result =
      app::get_provision_eu_basis(registry.documents, registry.eu, {"ABGB", "para1"});
  REQUIRE(result.has_value());
  CHECK(result.value().provision_content ==
        "Der Inbegriff der Gesetze macht das bürgerliche Recht aus.");

  const auto json = app::provision_eu_basis_to_json(result.value());
  REQUIRE(json["eu_references"].size() == 1);
  const auto& reference = json["eu_references"][0];
  CHECK(reference["full_citation"] == "directive:2020/999");
  CHECK_FALSE(reference.contains("title"));
  CHECK_FALSE(reference.contains("short_name"));
  CHECK_FALSE(reference.contains("article"));
  CHECK_FALSE(reference.contains("context"));
}

TEST_CASE("get_provision_eu_basis validates its input", "[app][eu]") {
  EuRegistry registry;
  REQUIRE(registry.db != nullptr);

  struct Case {
    app::GetProvisionEuBasisRequest request;
    std::string error;
  };
  const std::vector<Case> cases = {
      {{"", "§ 1"}, "document_id is required"},
      {{"ABGB", " "}, "provision_ref is required"},
      {{"StGB", "§ 1"}, "Document \"StGB\" not found in database"},
      {{"ABGB", "§ 99"}, "Provision § 99 not found in ABGB"},
  };
  for (const auto& c : cases) {
    INFO(c.request.document_id << " / " << c.request.provision_ref);
    const auto result = app::get_provision_eu_basis(registry.documents, registry.eu, c.request);
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error() == c.error);
  }

  // A provision without EU references is not an error.
  const auto none =
      app::get_provision_eu_basis(registry.documents, registry.eu, {"ABGB", "16"});
  REQUIRE(none.has_value());
  CHECK(none.value().eu_references.empty());
}

TEST_CASE("get_austrian_implementations lists one entry per statute", "[app][eu]") {
  EuRegistry registry;
  REQUIRE(registry.db != nullptr);

  const auto result = app::get_austrian_implementations(registry.documents, registry.eu,
                                                        {"regulation:2016/679", false, false});
  REQUIRE(result.has_value());
  const auto& report = result.value();

  CHECK(report.eu_title == "Datenschutz-Grundverordnung");
  CHECK(report.eu_short_name == "GDPR");
  REQUIRE(report.implementations.size() == 2);
  CHECK(report.implementations[0].document_id.value == "gesetz-10001597");
  CHECK(report.implementations[0].is_primary);
  CHECK(report.implementations[0].articles == std::vector<std::string>{"Art. 6", "Art. 51"});
  CHECK(report.implementations[1].document_id.value == "gesetz-10002296");
  CHECK(report.implementations[1].reference_type == "supplements");
  CHECK(report.implementations[1].status == "repealed");
}

TEST_CASE("get_austrian_implementations honours its filters", "[app][eu]") {
  EuRegistry registry;
  REQUIRE(registry.db != nullptr);

  const auto in_force = app::get_austrian_implementations(registry.documents, registry.eu,
                                                          {"regulation:2016/679", false, true});
  REQUIRE(in_force.has_value());
  REQUIRE(in_force.value().implementations.size() == 1);
  CHECK(in_force.value().implementations[0].status == "amended");

  const auto primary = app::get_austrian_implementations(registry.documents, registry.eu,
                                                         {"directive:2016/1148", true, false});
  REQUIRE(primary.has_value());
  CHECK(primary.value().implementations.empty());

  const auto unknown = app::get_austrian_implementations(registry.documents, registry.eu,
                                                         {"directive:1900/1", false, false});
  REQUIRE(unknown.has_value());
  CHECK(unknown.value().implementations.empty());
  CHECK_FALSE(app::implementation_report_to_json(unknown.value()).contains("eu_title"));

  const auto blank =
      app::get_austrian_implementations(registry.documents, registry.eu, {"", false, false});
  REQUIRE_FALSE(blank.has_value());
  CHECK(blank.error() == "eu_document_id is required");
}

TEST_CASE("search_eu_implementations counts statutes per EU document", "[app][eu]") {
  EuRegistry registry;
  REQUIRE(registry.db != nullptr);

  app::SearchEuImplementationsRequest request;
  request.type = "regulation";
  const auto result = app::search_eu_implementations(registry.eu, request);
  REQUIRE(result.has_value());
  REQUIRE(result.value().size() == 1);
  const auto& gdpr = result.value().front();
  CHECK(gdpr.austrian_statute_count == 2);
  CHECK(gdpr.primary_implementations ==
        std::vector<std::string>{"gesetz-10001597", "gesetz-10002296"});

  const auto json = app::eu_implementation_summaries_to_json(result.value());
  CHECK(json["count"] == 1);
  CHECK(json["results"][0]["eu_document"]["short_name"] == "GDPR");
}

TEST_CASE("search_eu_implementations filters by implementation", "[app][eu]") {
  EuRegistry registry;
  REQUIRE(registry.db != nullptr);

  app::SearchEuImplementationsRequest unimplemented;
  unimplemented.has_austrian_implementation = false;
  const auto none = app::search_eu_implementations(registry.eu, unimplemented);
  REQUIRE(none.has_value());
  CHECK(summary_ids(none.value()) == std::vector<std::string>{"directive:1995/46"});

  app::SearchEuImplementationsRequest implemented;
  implemented.has_austrian_implementation = true;
  implemented.limit = 2;
  const auto some = app::search_eu_implementations(registry.eu, implemented);
  REQUIRE(some.has_value());
  CHECK(summary_ids(some.value()) ==
        std::vector<std::string>{"directive:2020/999", "directive:2016/1148"});
}

TEST_CASE("search_eu_implementations clamps the limit", "[app][eu]") {
  EuRegistry registry;
  REQUIRE(registry.db != nullptr);

  for (const auto& [limit, expected] :
       std::vector<std::pair<int, std::size_t>>{{0, 1}, {-5, 1}, {2, 2}, {1000, 4}}) {
    INFO(limit);
    app::SearchEuImplementationsRequest request;
    request.limit = limit;
    const auto result = app::search_eu_implementations(registry.eu, request);
    REQUIRE(result.has_value());
    CHECK(result.value().size() == expected);
  }
}

TEST_CASE("search_eu_implementations rejects unknown types", "[app][eu]") {
  EuRegistry registry;
  REQUIRE(registry.db != nullptr);

  app::SearchEuImplementationsRequest request;
  request.type = "treaty";
  const auto result = app::search_eu_implementations(registry.eu, request);
  REQUIRE_FALSE(result.has_value());
  CHECK(result.error() == "Unknown type \"treaty\" (expected directive or regulation)");
}

TEST_CASE("validate_eu_compliance grades recorded references", "[app][eu]") {
  EuRegistry registry;
  REQUIRE(registry.db != nullptr);

  struct Case {
    app::ValidateEuComplianceRequest request;
    app::ComplianceStatus status;
    std::size_t references;
  };
  const std::vector<Case> cases = {
      {{"DSG", std::nullopt, std::nullopt}, app::ComplianceStatus::kPartial, 3},
      {{"DSG", std::nullopt, std::string{"regulation:2016/679"}},
       app::ComplianceStatus::kCompliant, 2},
      {{"DSG", std::string{"§ 4a"}, std::nullopt}, app::ComplianceStatus::kCompliant, 1},
      {{"ABGB", std::nullopt, std::nullopt}, app::ComplianceStatus::kUnclear, 1},
      {{"ABGB", std::string{"16"}, std::nullopt}, app::ComplianceStatus::kNotApplicable, 0},
  };
  for (const auto& c : cases) {
    INFO(c.request.document_id << " " << c.request.provision_ref.value_or("-") << " "
                               << c.request.eu_document_id.value_or("-"));
    const auto result = app::validate_eu_compliance(registry.documents, registry.eu, c.request);
    REQUIRE(result.has_value());
    CHECK(result.value().status == c.status);
    CHECK(result.value().eu_references_found == c.references);
  }
}

TEST_CASE("validate_eu_compliance explains its grade", "[app][eu]") {
  EuRegistry registry;
  REQUIRE(registry.db != nullptr);

  const auto partial = app::validate_eu_compliance(registry.documents, registry.eu,
                                                   {"DSG", std::nullopt, std::nullopt});
  REQUIRE(partial.has_value());
  REQUIRE(partial.value().warnings.size() == 1);
  CHECK(partial.value().warnings[0].find("non-primary") != std::string::npos);
  CHECK(app::compliance_report_to_json(partial.value())["compliance_status"] == "partial");

  const auto none = app::validate_eu_compliance(registry.documents, registry.eu,
                                                {"ABGB", std::string{"16"}, std::nullopt});
  REQUIRE(none.has_value());
  CHECK(none.value().warnings.empty());
  REQUIRE(none.value().recommendations.size() == 1);
  CHECK(app::compliance_report_to_json(none.value())["compliance_status"] == "not_applicable");

  const auto repealed = app::validate_eu_compliance(registry.documents, registry.eu,
                                                    {"EheG", std::nullopt, std::nullopt});
  REQUIRE(repealed.has_value());
  CHECK(repealed.value().status == app::ComplianceStatus::kCompliant);
  CHECK(repealed.value().warnings == std::vector<std::string>{"This statute has been repealed"});
}

TEST_CASE("validate_eu_compliance reports unknown documents and provisions", "[app][eu]") {
  EuRegistry registry;
  REQUIRE(registry.db != nullptr);

  const auto missing = app::validate_eu_compliance(registry.documents, registry.eu,
                                                   {"StGB", std::nullopt, std::nullopt});
  REQUIRE_FALSE(missing.has_value());
  CHECK(missing.error() == "Document \"StGB\" not found in database");

  const auto provision = app::validate_eu_compliance(registry.documents, registry.eu,
                                                     {"DSG", std::string{"§ 99"}, std::nullopt});
  REQUIRE(provision.has_value());
  CHECK(provision.value().status == app::ComplianceStatus::kUnclear);
  CHECK(provision.value().warnings ==
        std::vector<std::string>{"Provision \"§ 99\" not found in gesetz-10001597"});
}

TEST_CASE("EU tools answer from a registry without EU tables", "[app][eu]") {
  auto db = testing::open_fixture_db();
  REQUIRE(db != nullptr);
  storage::sqlite::SqliteDocumentStore documents(db);
  storage::sqlite::SqliteEuReferenceStore eu(db);

  const auto basis = app::get_eu_basis(documents, eu, {"DSG", false, {}});
  REQUIRE(basis.has_value());
  CHECK(basis.value().eu_documents.empty());

  const auto compliance =
      app::validate_eu_compliance(documents, eu, {"DSG", std::nullopt, std::nullopt});
  REQUIRE(compliance.has_value());
  CHECK(compliance.value().status == app::ComplianceStatus::kNotApplicable);

  const auto search = app::search_eu_implementations(eu, {});
  REQUIRE(search.has_value());
  CHECK(search.value().empty());
}
