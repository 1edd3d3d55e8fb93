#pragma once

#include "lexcite/core/ids.h"
#include "lexcite/core/result.h"
#include "lexcite/domain/eu_reference.h"
#include "lexcite/storage/document_store.h"
#include "lexcite/storage/eu_reference_store.h"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace lexcite::app {

constexpr int kDefaultEuSearchLimit = 20;
constexpr int kMaxEuSearchLimit = 100;

// ────────────────────────────────────────────────────────────────
// get_eu_basis
// ────────────────────────────────────────────────────────────────

struct GetEuBasisRequest {
  std::string document_id;  // canonical ID, title or short name
  bool include_articles{false};
  std::vector<std::string> reference_types;  // empty: every type
};

// EuBasisEntry is one EU document referenced by the statute, merged over
// all of its references.
struct EuBasisEntry {
  domain::EuDocument eu_document;
  std::string reference_type;  // of the first reference
  bool is_primary_implementation{false};  // any reference is primary
  std::vector<std::string> articles;  // distinct, in reference order
};

struct EuBasisReport {
  core::DocumentId document_id;
  std::string document_title;
  std::vector<EuBasisEntry> eu_documents;
  std::size_t total_eu_references{0};
  std::size_t directive_count{0};
  std::size_t regulation_count{0};
  bool include_articles{false};
};

// get_eu_basis lists the directives and regulations a statute refers to.
// Errors: empty document_id, unknown document.
[[nodiscard]] core::Result<EuBasisReport, std::string> get_eu_basis(
    const storage::IDocumentStore& store, const storage::IEuReferenceStore& eu_store,
    const GetEuBasisRequest& request);

// ────────────────────────────────────────────────────────────────
// get_provision_eu_basis
// ────────────────────────────────────────────────────────────────

struct GetProvisionEuBasisRequest {
  std::string document_id;
  std::string provision_ref;  // "1", "§ 4a", "para4a"
};

struct ProvisionEuBasis {
  core::DocumentId document_id;
  std::string provision_ref;  // as requested
  std::string provision_content;  // cleaned
  std::vector<domain::EuReference> eu_references;
};

// get_provision_eu_basis lists the EU references attached to one provision.
// Errors: empty document_id or provision_ref, unknown document, unknown
// provision.
[[nodiscard]] core::Result<ProvisionEuBasis, std::string> get_provision_eu_basis(
    const storage::IDocumentStore& store, const storage::IEuReferenceStore& eu_store,
    const GetProvisionEuBasisRequest& request);

// ────────────────────────────────────────────────────────────────
// get_austrian_implementations
// ────────────────────────────────────────────────────────────────

struct GetAustrianImplementationsRequest {
  std::string eu_document_id;  // "regulation:2016/679"
  bool primary_only{false};
  bool in_force_only{false};  // drops repealed statutes; amended ones are still in force
};

struct AustrianImplementation {
  core::DocumentId document_id;
  std::string title;
  std::string status;
  bool is_primary{false};
  std::string reference_type;
  std::vector<std::string> articles;
};

struct ImplementationReport {
  std::string eu_document_id;
  std::optional<std::string> eu_title;
  std::optional<std::string> eu_short_name;
  std::vector<AustrianImplementation> implementations;
};

// get_austrian_implementations lists the statutes referring to one EU
// document, one entry per statute. An unknown EU document yields no
// implementations. Error only when eu_document_id is empty.
[[nodiscard]] core::Result<ImplementationReport, std::string> get_austrian_implementations(
    const storage::IDocumentStore& store, const storage::IEuReferenceStore& eu_store,
    const GetAustrianImplementationsRequest& request);

// ────────────────────────────────────────────────────────────────
// search_eu_implementations
// ────────────────────────────────────────────────────────────────

struct SearchEuImplementationsRequest {
  std::optional<std::string> query;
  std::optional<std::string> type;  // directive | regulation
  std::optional<std::string> community;
  std::optional<int> year_from;
  std::optional<int> year_to;
  std::optional<bool> has_austrian_implementation;
  int limit{kDefaultEuSearchLimit};  // clamped to [1, kMaxEuSearchLimit]
};

struct EuImplementationSummary {
  domain::EuDocument eu_document;
  std::size_t austrian_statute_count{0};
  std::vector<std::string> primary_implementations;  // statute IDs
};

// search_eu_implementations finds EU documents and counts the statutes
// referring to each. Error only for an unknown type.
[[nodiscard]] core::Result<std::vector<EuImplementationSummary>, std::string>
search_eu_implementations(const storage::IEuReferenceStore& eu_store,
                          const SearchEuImplementationsRequest& request);

// ────────────────────────────────────────────────────────────────
// validate_eu_compliance
// ────────────────────────────────────────────────────────────────

enum class ComplianceStatus {
  kCompliant,
  kPartial,
  kUnclear,
  kNotApplicable,
};

[[nodiscard]] std::string compliance_status_to_string(ComplianceStatus status);

struct ValidateEuComplianceRequest {
  std::string document_id;
  std::optional<std::string> provision_ref;
  std::optional<std::string> eu_document_id;
};

struct ComplianceReport {
  core::DocumentId document_id;
  std::optional<std::string> provision_ref;
  ComplianceStatus status{ComplianceStatus::kNotApplicable};
  std::size_t eu_references_found{0};
  std::vector<std::string> warnings;
  std::vector<std::string> recommendations;
};

// validate_eu_compliance grades the recorded EU references of a statute or
// provision:
//   - no references: not_applicable
//   - only primary implementations: compliant
//   - primary and non-primary references: partial
//   - only non-primary references, or an unknown provision: unclear
// Errors: empty document_id, unknown document.
[[nodiscard]] core::Result<ComplianceReport, std::string> validate_eu_compliance(
    const storage::IDocumentStore& store, const storage::IEuReferenceStore& eu_store,
    const ValidateEuComplianceRequest& request);

[[nodiscard]] nlohmann::json eu_basis_report_to_json(const EuBasisReport& report);
[[nodiscard]] nlohmann::json provision_eu_basis_to_json(const ProvisionEuBasis& basis);
[[nodiscard]] nlohmann::json implementation_report_to_json(const ImplementationReport& report);
[[nodiscard]] nlohmann::json eu_implementation_summaries_to_json(
    const std::vector<EuImplementationSummary>& summaries);
[[nodiscard]] nlohmann::json compliance_report_to_json(const ComplianceReport& report);

}  // namespace lexcite::app
