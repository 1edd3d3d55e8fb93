#include "lexcite/storage/sqlite/sqlite_registry_metadata.h"

#include <iostream>
#include <string>
#include <utility>

namespace lexcite::storage::sqlite {

namespace {

const char* table_name(const RegistryTable table) {
  switch (table) {
    case RegistryTable::kLegalDocuments:
      return "legal_documents";
    case RegistryTable::kLegalProvisions:
      return "legal_provisions";
    case RegistryTable::kEuDocuments:
      return "eu_documents";
    case RegistryTable::kEuReferences:
      return "eu_references";
  }
  return "legal_documents";
}

}  // namespace

SqliteRegistryMetadata::SqliteRegistryMetadata(std::shared_ptr<SqliteDb> db)
    : db_(std::move(db)) {}

std::optional<std::string> SqliteRegistryMetadata::metadata_value(
    const std::string_view key) const {
  if (!db_->has_table("db_metadata")) {
    return std::nullopt;
  }

  PreparedStatement stmt(db_->connection(), "SELECT value FROM db_metadata WHERE key = ? LIMIT 1");
  if (!stmt.is_valid()) {
    std::cerr << "[sqlite] metadata_value failed: " << stmt.error() << "\n";
    return std::nullopt;
  }
  stmt.bind_text(1, key);

  const auto step = stmt.step();
  if (step == StepResult::kError) {
    std::cerr << "[sqlite] metadata_value failed: " << stmt.error() << "\n";
  }
  if (step != StepResult::kRow) {
    return std::nullopt;
  }
  return stmt.column_optional_text(0);
}

std::int64_t SqliteRegistryMetadata::row_count(const RegistryTable table) const {
  const std::string name = table_name(table);
  if (!db_->has_table(name)) {
    return 0;
  }

  PreparedStatement stmt(db_->connection(), "SELECT COUNT(*) FROM " + name);
  if (!stmt.is_valid()) {
    std::cerr << "[sqlite] row_count failed: " << stmt.error() << "\n";
    return 0;
  }
  if (stmt.step() != StepResult::kRow) {
    std::cerr << "[sqlite] row_count failed: " << stmt.error() << "\n";
    return 0;
  }
  return stmt.column_int64(0);
}

}  // namespace lexcite::storage::sqlite
