#pragma once

#include "lexcite/core/ids.h"
#include "lexcite/domain/eu_reference.h"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace lexcite::storage {

// IEuReferenceStore reads the EU cross-reference tables of the registry.
// Reference lists are ordered newest EU document first, then by EU document
// ID. A registry without EU data yields empty results, never errors.
class IEuReferenceStore {
 public:
  virtual ~IEuReferenceStore() = default;

  // Every reference of a statute, statute-level and provision-level.
  [[nodiscard]] virtual std::vector<domain::EuReference> statute_references(
      const core::DocumentId& document_id) const = 0;

  // References attached to one provision, addressed by its stored provision_ref.
  [[nodiscard]] virtual std::vector<domain::EuReference> provision_references(
      const core::DocumentId& document_id, const std::string& provision_ref) const = 0;

  // References pointing at one EU document, from any statute.
  [[nodiscard]] virtual std::vector<domain::EuReference> references_to(
      std::string_view eu_document_id) const = 0;

  [[nodiscard]] virtual std::optional<domain::EuDocument> get_eu_document(
      std::string_view eu_document_id) const = 0;

  // EU documents matching the filter, newest first.
  [[nodiscard]] virtual std::vector<domain::EuDocument> search_eu_documents(
      const domain::EuDocumentFilter& filter) const = 0;
};

enum class RegistryTable {
  kLegalDocuments,
  kLegalProvisions,
  kEuDocuments,
  kEuReferences,
};

// IRegistryMetadata reports build metadata and table sizes. Missing tables
// and keys read as absent or zero.
class IRegistryMetadata {
 public:
  virtual ~IRegistryMetadata() = default;

  // Value of a db_metadata key; nullopt when the table, key or value is absent.
  [[nodiscard]] virtual std::optional<std::string> metadata_value(std::string_view key) const = 0;

  [[nodiscard]] virtual std::int64_t row_count(RegistryTable table) const = 0;
};

}  // namespace lexcite::storage
