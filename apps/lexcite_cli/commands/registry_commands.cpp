#include "registry_commands.h"

#include "lexcite/app/registry_info.h"
#include "lexcite/storage/sqlite/sqlite_registry_metadata.h"

#include "common.h"
#include "shared/arg_parser.h"
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace {

struct RegistryCliConfig {
  std::optional<std::string> db_path;
};

// Opens the database named by --db, or returns nullptr after printing usage
// or the open error. exit_code is set on failure.
std::shared_ptr<lexcite::storage::sqlite::SqliteDb> open_from_args(
    int argc, char* argv[], const char* command,  // NOLINT(modernize-avoid-c-arrays)
    int& exit_code) {
  const std::vector<lexcite::apps::Option<RegistryCliConfig>> options = {
      db_option<RegistryCliConfig>(),
  };
  const auto parsed = lexcite::apps::parse_options(argc, argv, options);
  if (!parsed.ok || !parsed.positionals.empty() || !parsed.config.db_path.has_value()) {
    std::cerr << "Usage: lexcite_cli " << command << " --db <path>\n";
    exit_code = lexcite::apps::kExitUsage;
    return nullptr;
  }
  auto db = open_database(*parsed.config.db_path);
  if (!db) {
    exit_code = lexcite::apps::kExitFailure;
  }
  return db;
}

}  // namespace

int cmd_list_sources(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  int exit_code = lexcite::apps::kExitOk;
  auto db = open_from_args(argc, argv, "list-sources", exit_code);
  if (!db) {
    return exit_code;
  }
  const lexcite::storage::sqlite::SqliteRegistryMetadata metadata(db);
  print_json(lexcite::app::sources_report_to_json(lexcite::app::list_sources(metadata)));
  return lexcite::apps::kExitOk;
}

int cmd_about(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  int exit_code = lexcite::apps::kExitOk;
  auto db = open_from_args(argc, argv, "about", exit_code);
  if (!db) {
    return exit_code;
  }
  const lexcite::storage::sqlite::SqliteRegistryMetadata metadata(db);
  print_json(lexcite::app::about_report_to_json(lexcite::app::about(metadata)));
  return lexcite::apps::kExitOk;
}
