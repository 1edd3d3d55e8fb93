#include "lexcite/app/registry_info.h"

#include "lexcite/core/version.h"

#include <utility>

namespace lexcite::app {

namespace {

using storage::RegistryTable;

RegistryCounts read_counts(const storage::IRegistryMetadata& metadata) {
  RegistryCounts counts;
  counts.documents = metadata.row_count(RegistryTable::kLegalDocuments);
  counts.provisions = metadata.row_count(RegistryTable::kLegalProvisions);
  counts.eu_documents = metadata.row_count(RegistryTable::kEuDocuments);
  counts.eu_references = metadata.row_count(RegistryTable::kEuReferences);
  return counts;
}

DataSource ris_ogd_source() {
  DataSource source;
  source.name = "RIS OGD";
  source.authority = "Federal Chancellery (Bundeskanzleramt)";
  source.official_portal = "https://www.ris.bka.gv.at";
  source.api_documentation = "https://data.bka.gv.at/ris/ogd/v2.6/";
  source.retrieval_method = "API";
  source.update_frequency = "weekly";
  source.license = "CC BY 4.0";
  source.coverage = "Austrian federal laws (cybersecurity and data protection scope)";
  source.languages = {"de"};
  return source;
}

}  // namespace

SourcesReport list_sources(const storage::IRegistryMetadata& metadata) {
  SourcesReport report;
  report.sources.push_back(ris_ogd_source());

  auto& database = report.database;
  if (auto tier = metadata.metadata_value("tier")) {
    database.tier = std::move(*tier);
  }
  if (auto schema_version = metadata.metadata_value("schema_version")) {
    database.schema_version = std::move(*schema_version);
  }
  if (auto jurisdiction = metadata.metadata_value("jurisdiction")) {
    database.jurisdiction = std::move(*jurisdiction);
  }
  database.built_at = metadata.metadata_value("built_at");
  database.counts = read_counts(metadata);
  return report;
}

AboutReport about(const storage::IRegistryMetadata& metadata) {
  AboutReport report;
  report.name = "lexcite";
  report.version = core::kBuildVersion;
  report.dataset_built = metadata.metadata_value("built_at").value_or("unknown");
  report.jurisdiction = "Austria (AT)";
  report.counts = read_counts(metadata);
  report.provenance_sources = {"RIS OGD (statutes, statutory instruments)",
                               "EUR-Lex (EU directive references)"};
  report.license = "Legal source texts under CC BY 4.0.";
  report.access_model = "read-only";
  return report;
}

nlohmann::json sources_report_to_json(const SourcesReport& report) {
  nlohmann::json sources = nlohmann::json::array();
  for (const auto& source : report.sources) {
    sources.push_back({{"name", source.name},
                       {"authority", source.authority},
                       {"official_portal", source.official_portal},
                       {"api_documentation", source.api_documentation},
                       {"retrieval_method", source.retrieval_method},
                       {"update_frequency", source.update_frequency},
                       {"license", source.license},
                       {"coverage", source.coverage},
                       {"languages", source.languages}});
  }

  const auto& database = report.database;
  nlohmann::json j;
  j["sources"] = std::move(sources);
  j["database"] = {{"tier", database.tier},
                   {"schema_version", database.schema_version},
                   {"jurisdiction", database.jurisdiction},
                   {"built_at", database.built_at.has_value() ? nlohmann::json(*database.built_at)
                                                              : nlohmann::json(nullptr)},
                   {"document_count", database.counts.documents},
                   {"provision_count", database.counts.provisions},
                   {"eu_document_count", database.counts.eu_documents},
                   {"eu_reference_count", database.counts.eu_references}};
  return j;
}

nlohmann::json about_report_to_json(const AboutReport& report) {
  nlohmann::json j;
  j["server"] = {{"name", report.name}, {"version", report.version}};
  j["dataset"] = {{"built", report.dataset_built},
                  {"jurisdiction", report.jurisdiction},
                  {"counts",
                   {{"legal_documents", report.counts.documents},
                    {"legal_provisions", report.counts.provisions},
                    {"eu_documents", report.counts.eu_documents},
                    {"eu_references", report.counts.eu_references}}}};
  j["provenance"] = {{"sources", report.provenance_sources}, {"license", report.license}};
  j["security"] = {{"access_model", report.access_model}};
  return j;
}

}  // namespace lexcite::app
