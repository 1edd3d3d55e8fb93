#pragma once

#include "lexcite/storage/eu_reference_store.h"
#include "lexcite/storage/sqlite/sqlite_db.h"

#include <memory>

namespace lexcite::storage::sqlite {

// SqliteEuReferenceStore reads the EU cross-reference tables:
//   eu_documents(id, type, year, number, community, celex_number, title,
//                short_name, url_eur_lex)
//   eu_references(id, document_id, provision_id, eu_document_id, eu_article,
//                 reference_type, is_primary_implementation, full_citation,
//                 reference_context)
// provision_id points at legal_provisions.id and is NULL for statute-level
// references. A database without these tables reads as empty.
class SqliteEuReferenceStore final : public IEuReferenceStore {
 public:
  explicit SqliteEuReferenceStore(std::shared_ptr<SqliteDb> db);

  [[nodiscard]] std::vector<domain::EuReference> statute_references(
      const core::DocumentId& document_id) const override;
  [[nodiscard]] std::vector<domain::EuReference> provision_references(
      const core::DocumentId& document_id, const std::string& provision_ref) const override;
  [[nodiscard]] std::vector<domain::EuReference> references_to(
      std::string_view eu_document_id) const override;
  [[nodiscard]] std::optional<domain::EuDocument> get_eu_document(
      std::string_view eu_document_id) const override;
  [[nodiscard]] std::vector<domain::EuDocument> search_eu_documents(
      const domain::EuDocumentFilter& filter) const override;

 private:
  [[nodiscard]] bool has_eu_tables() const;
  [[nodiscard]] std::vector<domain::EuReference> query_references(
      const char* operation, const std::string& where,
      const std::vector<std::string>& params) const;

  std::shared_ptr<SqliteDb> db_;
};

}  // namespace lexcite::storage::sqlite
