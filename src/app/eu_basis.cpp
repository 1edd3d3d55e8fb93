#include "lexcite/app/eu_basis.h"

#include "lexcite/citation/provision_candidates.h"
#include "lexcite/core/unicode_text.h"
#include "lexcite/domain/json.h"
#include "lexcite/domain/legal_document.h"
#include "lexcite/text/content_cleaner.h"

#include <algorithm>
#include <map>

namespace lexcite::app {

namespace {

void add_distinct(std::vector<std::string>& values, const std::string& value) {
  if (std::find(values.begin(), values.end(), value) == values.end()) {
    values.push_back(value);
  }
}

bool wanted_type(const std::vector<std::string>& reference_types, const std::string& type) {
  return reference_types.empty() ||
         std::find(reference_types.begin(), reference_types.end(), type) != reference_types.end();
}

// Resolves the term to an existing document, or returns the lookup error.
core::Result<domain::LegalDocument, std::string> require_document(
    const storage::IDocumentStore& store, const std::string& raw_term) {
  using R = core::Result<domain::LegalDocument, std::string>;
  const std::string term = core::trim(raw_term);
  if (term.empty()) {
    return R::err("document_id is required");
  }
  const auto id = store.resolve_id(term);
  auto document = id ? store.get_document(*id) : std::nullopt;
  if (!document.has_value()) {
    return R::err("Document \"" + term + "\" not found in database");
  }
  return R::ok(std::move(*document));
}

std::optional<std::string> non_blank(const std::optional<std::string>& value) {
  if (!value.has_value()) {
    return std::nullopt;
  }
  std::string trimmed = core::trim(*value);
  if (trimmed.empty()) {
    return std::nullopt;
  }
  return trimmed;
}

}  // namespace

core::Result<EuBasisReport, std::string> get_eu_basis(const storage::IDocumentStore& store,
                                                      const storage::IEuReferenceStore& eu_store,
                                                      const GetEuBasisRequest& request) {
  using R = core::Result<EuBasisReport, std::string>;
  const auto document = require_document(store, request.document_id);
  if (!document.has_value()) {
    return R::err(document.error());
  }

  EuBasisReport report;
  report.document_id = document.value().id;
  report.document_title = document.value().title;
  report.include_articles = request.include_articles;

  std::map<std::string, std::size_t> entry_index;
  for (const auto& reference : eu_store.statute_references(report.document_id)) {
    if (!wanted_type(request.reference_types, reference.reference_type)) {
      continue;
    }
    ++report.total_eu_references;

    auto [it, inserted] =
        entry_index.emplace(reference.eu_document.id, report.eu_documents.size());
    if (inserted) {
      EuBasisEntry entry;
      entry.eu_document = reference.eu_document;
      entry.reference_type = reference.reference_type;
      report.eu_documents.push_back(std::move(entry));
    }
    auto& entry = report.eu_documents[it->second];
    entry.is_primary_implementation =
        entry.is_primary_implementation || reference.is_primary_implementation;
    if (reference.article.has_value()) {
      add_distinct(entry.articles, *reference.article);
    }
  }

  for (const auto& entry : report.eu_documents) {
    if (entry.eu_document.type == domain::kEuDirective) {
      ++report.directive_count;
    } else if (entry.eu_document.type == domain::kEuRegulation) {
      ++report.regulation_count;
    }
  }
  return R::ok(std::move(report));
}

core::Result<ProvisionEuBasis, std::string> get_provision_eu_basis(
    const storage::IDocumentStore& store, const storage::IEuReferenceStore& eu_store,
    const GetProvisionEuBasisRequest& request) {
  using R = core::Result<ProvisionEuBasis, std::string>;
  if (core::trim(request.document_id).empty()) {
    return R::err("document_id is required");
  }
  if (core::trim(request.provision_ref).empty()) {
    return R::err("provision_ref is required");
  }
  const auto document = require_document(store, request.document_id);
  if (!document.has_value()) {
    return R::err(document.error());
  }

  const auto& id = document.value().id;
  const auto provision =
      store.find_provision(id, citation::build_provision_candidates(request.provision_ref));
  if (!provision.has_value()) {
    return R::err("Provision " + request.provision_ref + " not found in " +
                  core::trim(request.document_id));
  }

  ProvisionEuBasis basis;
  basis.document_id = id;
  basis.provision_ref = request.provision_ref;
  basis.provision_content = text::clean_provision_content(provision->content);
  basis.eu_references = eu_store.provision_references(id, provision->provision_ref);
  return R::ok(std::move(basis));
}

core::Result<ImplementationReport, std::string> get_austrian_implementations(
    const storage::IDocumentStore& store, const storage::IEuReferenceStore& eu_store,
    const GetAustrianImplementationsRequest& request) {
  using R = core::Result<ImplementationReport, std::string>;
  const std::string eu_document_id = core::trim(request.eu_document_id);
  if (eu_document_id.empty()) {
    return R::err("eu_document_id is required");
  }

  ImplementationReport report;
  report.eu_document_id = eu_document_id;
  if (const auto eu_document = eu_store.get_eu_document(eu_document_id)) {
    report.eu_title = eu_document->title;
    report.eu_short_name = eu_document->short_name;
  }

  std::map<core::DocumentId, std::size_t> statute_index;
  for (const auto& reference : eu_store.references_to(eu_document_id)) {
    auto it = statute_index.find(reference.statute_id);
    if (it == statute_index.end()) {
      // References to statutes missing from legal_documents are skipped.
      const auto document = store.get_document(reference.statute_id);
      if (!document.has_value()) {
        continue;
      }
      AustrianImplementation implementation;
      implementation.document_id = document->id;
      implementation.title = document->title;
      implementation.status = document->status;
      implementation.reference_type = reference.reference_type;
      it = statute_index.emplace(reference.statute_id, report.implementations.size()).first;
      report.implementations.push_back(std::move(implementation));
    }
    auto& implementation = report.implementations[it->second];
    implementation.is_primary = implementation.is_primary || reference.is_primary_implementation;
    if (reference.article.has_value()) {
      add_distinct(implementation.articles, *reference.article);
    }
  }

  auto& implementations = report.implementations;
  implementations.erase(
      std::remove_if(implementations.begin(), implementations.end(),
                     [&](const AustrianImplementation& implementation) {
                       return (request.primary_only && !implementation.is_primary) ||
                              (request.in_force_only &&
                               implementation.status == domain::kStatusRepealed);
                     }),
      implementations.end());
  return R::ok(std::move(report));
}

core::Result<std::vector<EuImplementationSummary>, std::string> search_eu_implementations(
    const storage::IEuReferenceStore& eu_store, const SearchEuImplementationsRequest& request) {
  using R = core::Result<std::vector<EuImplementationSummary>, std::string>;
  const auto type = non_blank(request.type);
  if (type.has_value() && *type != domain::kEuDirective && *type != domain::kEuRegulation) {
    return R::err("Unknown type \"" + *type + "\" (expected directive or regulation)");
  }

  domain::EuDocumentFilter filter;
  filter.query = non_blank(request.query);
  filter.type = type;
  filter.community = non_blank(request.community);
  filter.year_from = request.year_from;
  filter.year_to = request.year_to;

  const auto limit = static_cast<std::size_t>(std::clamp(request.limit, 1, kMaxEuSearchLimit));
  std::vector<EuImplementationSummary> summaries;
  for (auto& eu_document : eu_store.search_eu_documents(filter)) {
    if (summaries.size() >= limit) {
      break;
    }

    EuImplementationSummary summary;
    std::vector<std::string> statutes;
    for (const auto& reference : eu_store.references_to(eu_document.id)) {
      add_distinct(statutes, reference.statute_id.value);
      if (reference.is_primary_implementation) {
        add_distinct(summary.primary_implementations, reference.statute_id.value);
      }
    }
    summary.austrian_statute_count = statutes.size();
    if (request.has_austrian_implementation.has_value() &&
        *request.has_austrian_implementation != (summary.austrian_statute_count > 0)) {
      continue;
    }
    summary.eu_document = std::move(eu_document);
    summaries.push_back(std::move(summary));
  }
  return R::ok(std::move(summaries));
}

std::string compliance_status_to_string(const ComplianceStatus status) {
  switch (status) {
    case ComplianceStatus::kCompliant:
      return "compliant";
    case ComplianceStatus::kPartial:
      return "partial";
    case ComplianceStatus::kUnclear:
      return "unclear";
    case ComplianceStatus::kNotApplicable:
      return "not_applicable";
  }
  return "unclear";
}

core::Result<ComplianceReport, std::string> validate_eu_compliance(
    const storage::IDocumentStore& store, const storage::IEuReferenceStore& eu_store,
    const ValidateEuComplianceRequest& request) {
  using R = core::Result<ComplianceReport, std::string>;
  const auto document = require_document(store, request.document_id);
  if (!document.has_value()) {
    return R::err(document.error());
  }

  ComplianceReport report;
  report.document_id = document.value().id;
  report.provision_ref = non_blank(request.provision_ref);
  if (document.value().status == domain::kStatusRepealed) {
    report.warnings.emplace_back("This statute has been repealed");
  }

  std::vector<domain::EuReference> references;
  if (report.provision_ref.has_value()) {
    const auto provision = store.find_provision(
        report.document_id, citation::build_provision_candidates(*report.provision_ref));
    if (!provision.has_value()) {
      report.status = ComplianceStatus::kUnclear;
      report.warnings.push_back("Provision \"" + *report.provision_ref + "\" not found in " +
                                report.document_id.value);
      return R::ok(std::move(report));
    }
    references = eu_store.provision_references(report.document_id, provision->provision_ref);
  } else {
    references = eu_store.statute_references(report.document_id);
  }

  if (const auto eu_document_id = non_blank(request.eu_document_id)) {
    references.erase(std::remove_if(references.begin(), references.end(),
                                    [&](const domain::EuReference& reference) {
                                      return reference.eu_document.id != *eu_document_id;
                                    }),
                     references.end());
  }

  report.eu_references_found = references.size();
  if (references.empty()) {
    report.status = ComplianceStatus::kNotApplicable;
    report.recommendations.emplace_back(
        "No EU references are recorded. EU cross-reference data may be incomplete; check "
        "eu_reference_count in list-sources before concluding there is no EU basis.");
    return R::ok(std::move(report));
  }

  const auto primary = static_cast<std::size_t>(
      std::count_if(references.begin(), references.end(), [](const domain::EuReference& r) {
        return r.is_primary_implementation;
      }));
  const std::size_t non_primary = references.size() - primary;
  if (non_primary == 0) {
    report.status = ComplianceStatus::kCompliant;
  } else if (primary > 0) {
    report.status = ComplianceStatus::kPartial;
    report.warnings.push_back(std::to_string(non_primary) + " of " +
                              std::to_string(references.size()) +
                              " EU references are non-primary (cited or applied, not "
                              "implemented)");
  } else {
    report.status = ComplianceStatus::kUnclear;
    report.warnings.emplace_back(
        "All EU references are non-primary; no implementing provision is recorded");
    report.recommendations.emplace_back(
        "Use eu-implementations on the EU document to find the primary implementing statute.");
  }
  return R::ok(std::move(report));
}

nlohmann::json eu_basis_report_to_json(const EuBasisReport& report) {
  nlohmann::json documents = nlohmann::json::array();
  for (const auto& entry : report.eu_documents) {
    nlohmann::json j = domain::eu_document_to_json(entry.eu_document);
    j["reference_type"] = entry.reference_type;
    j["is_primary_implementation"] = entry.is_primary_implementation;
    if (report.include_articles) {
      j["articles"] = entry.articles;
    }
    documents.push_back(std::move(j));
  }

  nlohmann::json j;
  j["document_id"] = report.document_id.value;
  j["document_title"] = report.document_title;
  j["eu_documents"] = std::move(documents);
  j["statistics"] = {{"total_eu_references", report.total_eu_references},
                     {"directive_count", report.directive_count},
                     {"regulation_count", report.regulation_count}};
  return j;
}

nlohmann::json provision_eu_basis_to_json(const ProvisionEuBasis& basis) {
  nlohmann::json references = nlohmann::json::array();
  for (const auto& reference : basis.eu_references) {
    references.push_back(domain::eu_reference_to_json(reference));
  }
  nlohmann::json j;
  j["document_id"] = basis.document_id.value;
  j["provision_ref"] = basis.provision_ref;
  j["provision_content"] = basis.provision_content;
  j["eu_references"] = std::move(references);
  return j;
}

nlohmann::json implementation_report_to_json(const ImplementationReport& report) {
  nlohmann::json implementations = nlohmann::json::array();
  for (const auto& implementation : report.implementations) {
    implementations.push_back({{"document_id", implementation.document_id.value},
                               {"title", implementation.title},
                               {"status", implementation.status},
                               {"is_primary", implementation.is_primary},
                               {"reference_type", implementation.reference_type},
                               {"articles", implementation.articles}});
  }
  nlohmann::json j;
  j["eu_document_id"] = report.eu_document_id;
  if (report.eu_title.has_value()) {
    j["eu_title"] = *report.eu_title;
  }
  if (report.eu_short_name.has_value()) {
    j["eu_short_name"] = *report.eu_short_name;
  }
  j["implementations"] = std::move(implementations);
  return j;
}

nlohmann::json eu_implementation_summaries_to_json(
    const std::vector<EuImplementationSummary>& summaries) {
  nlohmann::json results = nlohmann::json::array();
  for (const auto& summary : summaries) {
    results.push_back({{"eu_document", domain::eu_document_to_json(summary.eu_document)},
                       {"austrian_statute_count", summary.austrian_statute_count},
                       {"primary_implementations", summary.primary_implementations}});
  }
  nlohmann::json j;
  j["count"] = summaries.size();
  j["results"] = std::move(results);
  return j;
}

nlohmann::json compliance_report_to_json(const ComplianceReport& report) {
  nlohmann::json j;
  j["document_id"] = report.document_id.value;
  if (report.provision_ref.has_value()) {
    j["provision_ref"] = *report.provision_ref;
  }
  j["compliance_status"] = compliance_status_to_string(report.status);
  j["eu_references_found"] = report.eu_references_found;
  j["warnings"] = report.warnings;
  j["recommendations"] = report.recommendations;
  return j;
}

}  // namespace lexcite::app
