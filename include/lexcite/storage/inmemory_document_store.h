#pragma once

#include "lexcite/storage/document_store.h"

#include <map>
#include <vector>

namespace lexcite::storage {

// InMemoryDocumentStore keeps documents and provisions in std::map, so
// iteration (and therefore substring resolution) is ordered by DocumentId.
// Intended for tests and for embedding small fixed corpora.
class InMemoryDocumentStore final : public IDocumentStore {
 public:
  void upsert_document(const domain::LegalDocument& document);
  // Replaces any provision of the same document with the same provision_ref.
  void upsert_provision(const domain::Provision& provision);

  [[nodiscard]] std::optional<core::DocumentId> resolve_id(std::string_view term) const override;
  [[nodiscard]] std::optional<domain::LegalDocument> get_document(
      const core::DocumentId& id) const override;
  [[nodiscard]] bool provision_exists(
      const core::DocumentId& document_id,
      const domain::ProvisionCandidateSet& candidates) const override;
  [[nodiscard]] std::optional<domain::Provision> find_provision(
      const core::DocumentId& document_id,
      const domain::ProvisionCandidateSet& candidates) const override;
  [[nodiscard]] std::vector<domain::Provision> list_provisions(
      const core::DocumentId& document_id, std::size_t limit) const override;

 private:
  std::map<core::DocumentId, domain::LegalDocument> documents_;
  // Kept sorted by order_index per document.
  std::map<core::DocumentId, std::vector<domain::Provision>> provisions_;
};

}  // namespace lexcite::storage
