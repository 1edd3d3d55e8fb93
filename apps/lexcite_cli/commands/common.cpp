#include "common.h"

#include <exception>
#include <iostream>

void print_json(const nlohmann::json& j) {
  std::cout << j.dump(2, ' ', false, nlohmann::json::error_handler_t::replace) << "\n";
}

std::shared_ptr<lexcite::storage::sqlite::SqliteDb> open_database(const std::string& path) {
  auto db_result = lexcite::storage::sqlite::SqliteDb::open(path);
  if (!db_result.has_value()) {
    std::cerr << "Failed to open database: " << db_result.error() << "\n";
    return nullptr;
  }
  return db_result.value();
}

bool check_registry_tables(const lexcite::storage::sqlite::SqliteDb& db, const std::string& path) {
  if (!db.has_table("legal_documents") || !db.has_table("legal_provisions")) {
    std::cerr << "Error: " << path << " is not a registry database (legal_documents, "
              << "legal_provisions missing)\n";
    return false;
  }
  return true;
}

std::shared_ptr<lexcite::storage::sqlite::SqliteDocumentStore> open_registry(
    const std::string& path) {
  auto db = open_database(path);
  if (!db || !check_registry_tables(*db, path)) {
    return nullptr;
  }
  return std::make_shared<lexcite::storage::sqlite::SqliteDocumentStore>(db);
}

bool parse_int(const std::string& value, int& out) {
  try {
    std::size_t consumed = 0;
    const int parsed = std::stoi(value, &consumed);
    if (consumed != value.size()) {
      return false;
    }
    out = parsed;
    return true;
  } catch (const std::exception&) {
    return false;
  }
}
