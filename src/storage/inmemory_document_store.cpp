#include "lexcite/storage/inmemory_document_store.h"

#include "lexcite/core/normalization.h"
#include "lexcite/core/unicode_text.h"

#include <algorithm>

namespace lexcite::storage {

void InMemoryDocumentStore::upsert_document(const domain::LegalDocument& document) {
  documents_[document.id] = document;
}

void InMemoryDocumentStore::upsert_provision(const domain::Provision& provision) {
  auto& list = provisions_[provision.document_id];
  auto existing = std::find_if(list.begin(), list.end(), [&](const domain::Provision& p) {
    return p.provision_ref == provision.provision_ref;
  });
  if (existing != list.end()) {
    *existing = provision;
  } else {
    list.push_back(provision);
  }
  std::stable_sort(list.begin(), list.end(),
                   [](const domain::Provision& a, const domain::Provision& b) {
                     return a.order_index < b.order_index;
                   });
}

std::optional<core::DocumentId> InMemoryDocumentStore::resolve_id(
    const std::string_view term) const {
  const std::string trimmed = core::trim(term);
  if (trimmed.empty()) {
    return std::nullopt;
  }

  if (documents_.count(core::DocumentId{trimmed}) > 0) {
    return core::DocumentId{trimmed};
  }

  const std::string lowered = core::normalize_ascii_lower(trimmed);
  for (const auto& [id, document] : documents_) {
    if (core::normalize_ascii_lower(document.title) == lowered ||
        (document.short_name && core::normalize_ascii_lower(*document.short_name) == lowered)) {
      return id;
    }
  }

  for (const auto& [id, document] : documents_) {
    if (core::contains_ascii_ci(document.title, trimmed)) {
      return id;
    }
  }

  return std::nullopt;
}

std::optional<domain::LegalDocument> InMemoryDocumentStore::get_document(
    const core::DocumentId& id) const {
  auto it = documents_.find(id);
  if (it != documents_.end()) {
    return it->second;
  }
  return std::nullopt;
}

bool InMemoryDocumentStore::provision_exists(
    const core::DocumentId& document_id, const domain::ProvisionCandidateSet& candidates) const {
  return find_provision(document_id, candidates).has_value();
}

std::optional<domain::Provision> InMemoryDocumentStore::find_provision(
    const core::DocumentId& document_id, const domain::ProvisionCandidateSet& candidates) const {
  auto it = provisions_.find(document_id);
  if (it == provisions_.end() || candidates.empty()) {
    return std::nullopt;
  }
  for (const auto& provision : it->second) {
    if (matches_candidates(provision, candidates)) {
      return provision;
    }
  }
  return std::nullopt;
}

std::vector<domain::Provision> InMemoryDocumentStore::list_provisions(
    const core::DocumentId& document_id, const std::size_t limit) const {
  auto it = provisions_.find(document_id);
  if (it == provisions_.end()) {
    return {};
  }
  const auto count = std::min(limit, it->second.size());
  return {it->second.begin(), it->second.begin() + static_cast<std::ptrdiff_t>(count)};
}

}  // namespace lexcite::storage
