#pragma once

#include "lexcite/core/ids.h"
#include "lexcite/core/result.h"
#include "lexcite/domain/legal_document.h"
#include "lexcite/domain/provision_candidates.h"
#include "lexcite/domain/search.h"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace lexcite::storage {

// IDocumentStore is the engine's view of the statute registry.
// Implementations report lookup failures as "not found"; they never throw.
class IDocumentStore {
 public:
  virtual ~IDocumentStore() = default;

  // Resolves a canonical ID, title, short name or title fragment to a
  // document ID. Tried in order: exact ID, exact title or short name
  // (ASCII case-insensitive), title substring (first by ID order).
  [[nodiscard]] virtual std::optional<core::DocumentId> resolve_id(std::string_view term) const = 0;

  [[nodiscard]] virtual std::optional<domain::LegalDocument> get_document(
      const core::DocumentId& id) const = 0;

  // True when a provision of the document matches any candidate key
  // (provision_ref against provision_refs, section against sections).
  [[nodiscard]] virtual bool provision_exists(
      const core::DocumentId& document_id,
      const domain::ProvisionCandidateSet& candidates) const = 0;

  // First matching provision by order_index.
  [[nodiscard]] virtual std::optional<domain::Provision> find_provision(
      const core::DocumentId& document_id,
      const domain::ProvisionCandidateSet& candidates) const = 0;

  // Provisions of a document in order_index order, at most limit entries.
  [[nodiscard]] virtual std::vector<domain::Provision> list_provisions(
      const core::DocumentId& document_id, std::size_t limit) const = 0;
};

// IProvisionSearchIndex runs one FTS5 expression. An expression the engine
// rejects comes back as an error so the caller can retry with a fallback.
class IProvisionSearchIndex {
 public:
  virtual ~IProvisionSearchIndex() = default;

  [[nodiscard]] virtual core::Result<std::vector<domain::SearchHit>, std::string> search(
      const std::string& fts_expression, const domain::SearchFilter& filter) const = 0;
};

// matches_candidates applies the candidate-set comparison to one provision.
[[nodiscard]] inline bool matches_candidates(const domain::Provision& provision,
                                             const domain::ProvisionCandidateSet& candidates) {
  for (const auto& ref : candidates.provision_refs) {
    if (provision.provision_ref == ref) {
      return true;
    }
  }
  for (const auto& section : candidates.sections) {
    if (provision.section == section) {
      return true;
    }
  }
  return false;
}

}  // namespace lexcite::storage
