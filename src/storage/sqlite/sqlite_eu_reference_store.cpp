#include "lexcite/storage/sqlite/sqlite_eu_reference_store.h"

#include "lexcite/core/normalization.h"

#include <iostream>
#include <string>
#include <utility>

namespace lexcite::storage::sqlite {

namespace {

constexpr const char* kEuDocumentColumns =
    "ed.id, ed.type, ed.year, ed.number, ed.community, ed.celex_number, ed.title, "
    "ed.short_name, ed.url_eur_lex";

// Reads the nine kEuDocumentColumns starting at column 0.
domain::EuDocument read_eu_document(const PreparedStatement& stmt) {
  domain::EuDocument document;
  document.id = stmt.column_text(0);
  document.type = stmt.column_text(1);
  document.year = stmt.column_int(2);
  document.number = stmt.column_optional_int(3);
  document.community = stmt.column_optional_text(4);
  document.celex_number = stmt.column_optional_text(5);
  document.title = stmt.column_optional_text(6);
  document.short_name = stmt.column_optional_text(7);
  document.url_eur_lex = stmt.column_optional_text(8);
  return document;
}

void log_failure(const char* operation, const std::string& error) {
  std::cerr << "[sqlite] " << operation << " failed: " << error << "\n";
}

}  // namespace

SqliteEuReferenceStore::SqliteEuReferenceStore(std::shared_ptr<SqliteDb> db)
    : db_(std::move(db)) {}

bool SqliteEuReferenceStore::has_eu_tables() const {
  return db_->has_table("eu_documents") && db_->has_table("eu_references");
}

std::vector<domain::EuReference> SqliteEuReferenceStore::query_references(
    const char* operation, const std::string& where,
    const std::vector<std::string>& params) const {
  if (!has_eu_tables()) {
    return {};
  }

  PreparedStatement stmt(
      db_->connection(),
      std::string("SELECT ") + kEuDocumentColumns +
          ", er.document_id, lp.provision_ref, er.eu_article, er.reference_type, "
          "er.is_primary_implementation, er.full_citation, er.reference_context "
          "FROM eu_references er "
          "JOIN eu_documents ed ON ed.id = er.eu_document_id "
          "LEFT JOIN legal_provisions lp ON lp.id = er.provision_id "
          "WHERE " +
          where + " ORDER BY ed.year DESC, ed.id, er.id");
  if (!stmt.is_valid()) {
    log_failure(operation, stmt.error());
    return {};
  }
  for (std::size_t i = 0; i < params.size(); ++i) {
    stmt.bind_text(static_cast<int>(i) + 1, params[i]);
  }

  std::vector<domain::EuReference> references;
  while (true) {
    const auto step = stmt.step();
    if (step == StepResult::kError) {
      log_failure(operation, stmt.error());
    }
    if (step != StepResult::kRow) {
      break;
    }
    domain::EuReference reference;
    reference.eu_document = read_eu_document(stmt);
    reference.statute_id = core::DocumentId{stmt.column_text(9)};
    reference.provision_ref = stmt.column_optional_text(10);
    reference.article = stmt.column_optional_text(11);
    reference.reference_type = stmt.column_text(12);
    reference.is_primary_implementation = stmt.column_int(13) != 0;
    reference.full_citation = stmt.column_optional_text(14);
    reference.context = stmt.column_optional_text(15);
    references.push_back(std::move(reference));
  }
  return references;
}

std::vector<domain::EuReference> SqliteEuReferenceStore::statute_references(
    const core::DocumentId& document_id) const {
  return query_references("statute_references", "er.document_id = ?", {document_id.value});
}

std::vector<domain::EuReference> SqliteEuReferenceStore::provision_references(
    const core::DocumentId& document_id, const std::string& provision_ref) const {
  return query_references("provision_references",
                          "er.document_id = ? AND lp.document_id = ? AND lp.provision_ref = ?",
                          {document_id.value, document_id.value, provision_ref});
}

std::vector<domain::EuReference> SqliteEuReferenceStore::references_to(
    const std::string_view eu_document_id) const {
  return query_references("references_to", "er.eu_document_id = ?",
                          {std::string(eu_document_id)});
}

std::optional<domain::EuDocument> SqliteEuReferenceStore::get_eu_document(
    const std::string_view eu_document_id) const {
  if (!db_->has_table("eu_documents")) {
    return std::nullopt;
  }

  PreparedStatement stmt(db_->connection(), std::string("SELECT ") + kEuDocumentColumns +
                                                " FROM eu_documents ed WHERE ed.id = ? LIMIT 1");
  if (!stmt.is_valid()) {
    log_failure("get_eu_document", stmt.error());
    return std::nullopt;
  }
  stmt.bind_text(1, eu_document_id);

  const auto step = stmt.step();
  if (step == StepResult::kError) {
    log_failure("get_eu_document", stmt.error());
  }
  if (step != StepResult::kRow) {
    return std::nullopt;
  }
  return read_eu_document(stmt);
}

std::vector<domain::EuDocument> SqliteEuReferenceStore::search_eu_documents(
    const domain::EuDocumentFilter& filter) const {
  if (!db_->has_table("eu_documents")) {
    return {};
  }

  std::string sql =
      std::string("SELECT ") + kEuDocumentColumns + " FROM eu_documents ed WHERE 1 = 1";
  if (filter.query.has_value()) {
    sql +=
        " AND (ed.id LIKE ?1 ESCAPE '\\' OR ed.title LIKE ?1 ESCAPE '\\' "
        "OR ed.short_name LIKE ?1 ESCAPE '\\')";
  }
  if (filter.type.has_value()) {
    sql += " AND ed.type = ?2";
  }
  if (filter.community.has_value()) {
    sql += " AND ed.community = ?3";
  }
  if (filter.year_from.has_value()) {
    sql += " AND ed.year >= ?4";
  }
  if (filter.year_to.has_value()) {
    sql += " AND ed.year <= ?5";
  }
  sql += " ORDER BY ed.year DESC, ed.id";

  PreparedStatement stmt(db_->connection(), sql);
  if (!stmt.is_valid()) {
    log_failure("search_eu_documents", stmt.error());
    return {};
  }
  if (filter.query.has_value()) {
    stmt.bind_text(1, "%" + core::escape_like_pattern(*filter.query) + "%");
  }
  if (filter.type.has_value()) {
    stmt.bind_text(2, *filter.type);
  }
  if (filter.community.has_value()) {
    stmt.bind_text(3, *filter.community);
  }
  if (filter.year_from.has_value()) {
    stmt.bind_int(4, *filter.year_from);
  }
  if (filter.year_to.has_value()) {
    stmt.bind_int(5, *filter.year_to);
  }

  std::vector<domain::EuDocument> documents;
  while (true) {
    const auto step = stmt.step();
    if (step == StepResult::kError) {
      log_failure("search_eu_documents", stmt.error());
    }
    if (step != StepResult::kRow) {
      break;
    }
    documents.push_back(read_eu_document(stmt));
  }
  return documents;
}

}  // namespace lexcite::storage::sqlite
