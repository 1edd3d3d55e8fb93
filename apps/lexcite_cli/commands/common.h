#pragma once

#include "lexcite/storage/sqlite/sqlite_db.h"
#include "lexcite/storage/sqlite/sqlite_document_store.h"

#include <nlohmann/json.hpp>

#include "shared/arg_parser.h"
#include <memory>
#include <string>

// print_json writes j to stdout, pretty-printed. Invalid UTF-8 from registry
// text is replaced rather than aborting the dump.
void print_json(const nlohmann::json& j);

// open_registry opens the registry database read-only, or prints the error
// and returns nullptr.
std::shared_ptr<lexcite::storage::sqlite::SqliteDocumentStore> open_registry(
    const std::string& path);

// check_registry_tables prints an error and returns false when db lacks the
// registry tables.
bool check_registry_tables(const lexcite::storage::sqlite::SqliteDb& db, const std::string& path);

// open_database opens any SQLite file read-only, or prints the error and
// returns nullptr. Unlike open_registry it does not require the registry
// tables.
std::shared_ptr<lexcite::storage::sqlite::SqliteDb> open_database(const std::string& path);

// parse_int reads a whole-string integer into out. False on any trailing
// characters or overflow.
bool parse_int(const std::string& value, int& out);

template <typename Config>
lexcite::apps::Option<Config> db_option() {
  return {"--db", true, "Path to the registry SQLite database",
          [](Config& c, const std::string& v) {
            c.db_path = v;
            return true;
          }};
}

template <typename Config>
lexcite::apps::Option<Config> document_option() {
  return {"--document", true, "Document ID, title or short name",
          [](Config& c, const std::string& v) {
            c.document_id = v;
            return true;
          }};
}
