#include "lexcite/storage/sqlite/sqlite_document_store.h"

#include "lexcite/core/normalization.h"
#include "lexcite/core/unicode_text.h"

#include <algorithm>
#include <iostream>
#include <string>

namespace lexcite::storage::sqlite {

namespace {

constexpr const char* kProvisionColumns =
    "document_id, provision_ref, chapter, section, title, content, order_index";

// "(provision_ref = ? OR ... OR section = ?)" for the candidate set.
std::string candidate_clause(const domain::ProvisionCandidateSet& candidates) {
  std::string clause = "(";
  bool first = true;
  for (std::size_t i = 0; i < candidates.provision_refs.size(); ++i) {
    clause += first ? "provision_ref = ?" : " OR provision_ref = ?";
    first = false;
  }
  for (std::size_t i = 0; i < candidates.sections.size(); ++i) {
    clause += first ? "section = ?" : " OR section = ?";
    first = false;
  }
  clause += ")";
  return clause;
}

void bind_candidates(PreparedStatement& stmt, const int first_index,
                     const domain::ProvisionCandidateSet& candidates) {
  int index = first_index;
  for (const auto& ref : candidates.provision_refs) {
    stmt.bind_text(index++, ref);
  }
  for (const auto& section : candidates.sections) {
    stmt.bind_text(index++, section);
  }
}

domain::Provision read_provision(const PreparedStatement& stmt) {
  domain::Provision provision;
  provision.document_id = core::DocumentId{stmt.column_text(0)};
  provision.provision_ref = stmt.column_text(1);
  provision.chapter = stmt.column_optional_text(2);
  provision.section = stmt.column_text(3);
  provision.title = stmt.column_optional_text(4);
  provision.content = stmt.column_text(5);
  provision.order_index = stmt.column_int(6);
  return provision;
}

void log_failure(const char* operation, const std::string& error) {
  std::cerr << "[sqlite] " << operation << " failed: " << error << "\n";
}

}  // namespace

SqliteDocumentStore::SqliteDocumentStore(std::shared_ptr<SqliteDb> db) : db_(std::move(db)) {}

std::optional<core::DocumentId> SqliteDocumentStore::query_single_id(const std::string& sql,
                                                                     const std::string& param,
                                                                     const int param_count) const {
  PreparedStatement stmt(db_->connection(), sql);
  if (!stmt.is_valid()) {
    log_failure("resolve_id", stmt.error());
    return std::nullopt;
  }
  for (int i = 1; i <= param_count; ++i) {
    stmt.bind_text(i, param);
  }

  switch (stmt.step()) {
    case StepResult::kRow:
      return core::DocumentId{stmt.column_text(0)};
    case StepResult::kDone:
      return std::nullopt;
    case StepResult::kError:
      log_failure("resolve_id", stmt.error());
      return std::nullopt;
  }
  return std::nullopt;
}

std::optional<core::DocumentId> SqliteDocumentStore::resolve_id(const std::string_view term) const {
  const std::string trimmed = core::trim(term);
  if (trimmed.empty()) {
    return std::nullopt;
  }

  if (auto id =
          query_single_id("SELECT id FROM legal_documents WHERE id = ? LIMIT 1", trimmed, 1)) {
    return id;
  }

  if (auto id = query_single_id(
          "SELECT id FROM legal_documents "
          "WHERE lower(title) = lower(?) OR lower(short_name) = lower(?) "
          "ORDER BY id LIMIT 1",
          trimmed, 2)) {
    return id;
  }

  return query_single_id(
      "SELECT id FROM legal_documents WHERE title LIKE ? ESCAPE '\\' ORDER BY id LIMIT 1",
      "%" + core::escape_like_pattern(trimmed) + "%", 1);
}

std::optional<domain::LegalDocument> SqliteDocumentStore::get_document(
    const core::DocumentId& id) const {
  PreparedStatement stmt(db_->connection(),
                         "SELECT id, title, short_name, status, type, issued_date, in_force_date "
                         "FROM legal_documents WHERE id = ? LIMIT 1");
  if (!stmt.is_valid()) {
    log_failure("get_document", stmt.error());
    return std::nullopt;
  }
  stmt.bind_text(1, id.value);

  const auto step = stmt.step();
  if (step == StepResult::kError) {
    log_failure("get_document", stmt.error());
  }
  if (step != StepResult::kRow) {
    return std::nullopt;
  }

  domain::LegalDocument document;
  document.id = core::DocumentId{stmt.column_text(0)};
  document.title = stmt.column_text(1);
  document.short_name = stmt.column_optional_text(2);
  document.status = stmt.column_text(3);
  document.type = stmt.column_text(4);
  document.issued_date = stmt.column_optional_text(5);
  document.in_force_date = stmt.column_optional_text(6);
  return document;
}

bool SqliteDocumentStore::provision_exists(const core::DocumentId& document_id,
                                           const domain::ProvisionCandidateSet& candidates) const {
  if (candidates.empty()) {
    return false;
  }

  PreparedStatement stmt(db_->connection(),
                         "SELECT 1 FROM legal_provisions WHERE document_id = ? AND " +
                             candidate_clause(candidates) + " LIMIT 1");
  if (!stmt.is_valid()) {
    log_failure("provision_exists", stmt.error());
    return false;
  }
  stmt.bind_text(1, document_id.value);
  bind_candidates(stmt, 2, candidates);

  const auto step = stmt.step();
  if (step == StepResult::kError) {
    log_failure("provision_exists", stmt.error());
  }
  return step == StepResult::kRow;
}

std::optional<domain::Provision> SqliteDocumentStore::find_provision(
    const core::DocumentId& document_id, const domain::ProvisionCandidateSet& candidates) const {
  if (candidates.empty()) {
    return std::nullopt;
  }

  PreparedStatement stmt(db_->connection(),
                         std::string("SELECT ") + kProvisionColumns +
                             " FROM legal_provisions WHERE document_id = ? AND " +
                             candidate_clause(candidates) + " ORDER BY order_index LIMIT 1");
  if (!stmt.is_valid()) {
    log_failure("find_provision", stmt.error());
    return std::nullopt;
  }
  stmt.bind_text(1, document_id.value);
  bind_candidates(stmt, 2, candidates);

  const auto step = stmt.step();
  if (step == StepResult::kError) {
    log_failure("find_provision", stmt.error());
  }
  if (step != StepResult::kRow) {
    return std::nullopt;
  }
  return read_provision(stmt);
}

std::vector<domain::Provision> SqliteDocumentStore::list_provisions(
    const core::DocumentId& document_id, const std::size_t limit) const {
  PreparedStatement stmt(db_->connection(),
                         std::string("SELECT ") + kProvisionColumns +
                             " FROM legal_provisions WHERE document_id = ? "
                             "ORDER BY order_index LIMIT ?");
  if (!stmt.is_valid()) {
    log_failure("list_provisions", stmt.error());
    return {};
  }
  stmt.bind_text(1, document_id.value);
  stmt.bind_int(2, static_cast<int>(std::min<std::size_t>(limit, 1'000'000)));

  std::vector<domain::Provision> provisions;
  while (true) {
    const auto step = stmt.step();
    if (step == StepResult::kRow) {
      provisions.push_back(read_provision(stmt));
      continue;
    }
    if (step == StepResult::kError) {
      log_failure("list_provisions", stmt.error());
    }
    break;
  }
  return provisions;
}

core::Result<std::vector<domain::SearchHit>, std::string> SqliteDocumentStore::search(
    const std::string& fts_expression, const domain::SearchFilter& filter) const {
  using SearchResult = core::Result<std::vector<domain::SearchHit>, std::string>;

  std::string sql =
      "SELECT lp.document_id, ld.title, lp.provision_ref, lp.section, "
      "snippet(provisions_fts, 0, '>>>', '<<<', '...', 32), bm25(provisions_fts) "
      "FROM provisions_fts "
      "JOIN legal_provisions lp ON lp.id = provisions_fts.rowid "
      "JOIN legal_documents ld ON ld.id = lp.document_id "
      "WHERE provisions_fts MATCH ?";
  if (filter.document_id) {
    sql += " AND lp.document_id = ?";
  }
  if (filter.status) {
    sql += " AND ld.status = ?";
  }
  sql += " ORDER BY bm25(provisions_fts) LIMIT ?";

  PreparedStatement stmt(db_->connection(), sql);
  if (!stmt.is_valid()) {
    return SearchResult::err(stmt.error());
  }

  int index = 1;
  stmt.bind_text(index++, fts_expression);
  if (filter.document_id) {
    stmt.bind_text(index++, filter.document_id->value);
  }
  if (filter.status) {
    stmt.bind_text(index++, *filter.status);
  }
  stmt.bind_int(index, filter.limit);

  std::vector<domain::SearchHit> hits;
  while (true) {
    const auto step = stmt.step();
    if (step == StepResult::kDone) {
      break;
    }
    if (step == StepResult::kError) {
      // FTS5 reports malformed MATCH expressions here, not at prepare time.
      return SearchResult::err(stmt.error());
    }
    domain::SearchHit hit;
    hit.document_id = core::DocumentId{stmt.column_text(0)};
    hit.document_title = stmt.column_text(1);
    hit.provision_ref = stmt.column_text(2);
    hit.section = stmt.column_text(3);
    hit.snippet = stmt.column_text(4);
    // bm25() is negative, lower is better.
    hit.relevance = -stmt.column_double(5);
    hits.push_back(std::move(hit));
  }

  return SearchResult::ok(std::move(hits));
}

}  // namespace lexcite::storage::sqlite
