#pragma once

#include "lexcite/storage/document_store.h"
#include "lexcite/storage/sqlite/sqlite_db.h"

#include <memory>

namespace lexcite::storage::sqlite {

// SqliteDocumentStore reads a registry database produced by the ingestion
// pipeline. Expected tables:
//   legal_documents(id, title, short_name, status, type, issued_date, in_force_date)
//   legal_provisions(id INTEGER PRIMARY KEY, document_id, provision_ref, chapter,
//                    section, title, content, order_index)
//   provisions_fts  FTS5 over (content, title), rowid = legal_provisions.id
//
// SQL failures are written to stderr and reported to callers as "not found";
// search() alone returns them, so a rejected FTS5 expression can be retried.
class SqliteDocumentStore final : public IDocumentStore, public IProvisionSearchIndex {
 public:
  explicit SqliteDocumentStore(std::shared_ptr<SqliteDb> db);

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

  [[nodiscard]] core::Result<std::vector<domain::SearchHit>, std::string> search(
      const std::string& fts_expression, const domain::SearchFilter& filter) const override;

 private:
  [[nodiscard]] std::optional<core::DocumentId> query_single_id(const std::string& sql,
                                                                const std::string& param,
                                                                int param_count) const;

  std::shared_ptr<SqliteDb> db_;
};

}  // namespace lexcite::storage::sqlite
