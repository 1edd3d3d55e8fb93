#include "eu_commands.h"

#include "lexcite/app/eu_basis.h"
#include "lexcite/storage/sqlite/sqlite_document_store.h"
#include "lexcite/storage/sqlite/sqlite_eu_reference_store.h"

#include "common.h"
#include "shared/arg_parser.h"
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace {

using lexcite::storage::sqlite::SqliteDocumentStore;
using lexcite::storage::sqlite::SqliteEuReferenceStore;

struct EuCliConfig {
  std::optional<std::string> db_path;
  std::optional<std::string> document_id;
  std::optional<std::string> provision_ref;
  std::optional<std::string> eu_document_id;
  bool include_articles{false};
  bool primary_only{false};
  bool in_force_only{false};
  std::vector<std::string> reference_types;
};

struct SearchEuCliConfig {
  std::optional<std::string> db_path;
  lexcite::app::SearchEuImplementationsRequest request;
};

lexcite::apps::Option<EuCliConfig> provision_ref_option() {
  return {"--provision-ref", true, "Provision reference, e.g. \"§ 4a\" or para4a",
          [](EuCliConfig& c, const std::string& v) {
            c.provision_ref = v;
            return true;
          }};
}

// Reads a --year-from or --year-to value.
bool parse_year(const std::string& flag, const std::string& value, std::optional<int>& out) {
  int year = 0;
  if (!parse_int(value, year)) {
    std::cerr << "Invalid " << flag << ": " << value << " (expected a year)\n";
    return false;
  }
  out = year;
  return true;
}

// Prints the error or the rendered report and maps the outcome to an exit code.
template <typename T, typename Render>
int print_result(const lexcite::core::Result<T, std::string>& result, Render render) {
  if (!result.has_value()) {
    std::cerr << "Error: " << result.error() << "\n";
    return lexcite::apps::kExitFailure;
  }
  print_json(render(result.value()));
  return lexcite::apps::kExitOk;
}

}  // namespace

int cmd_eu_basis(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  const std::vector<lexcite::apps::Option<EuCliConfig>> options = {
      db_option<EuCliConfig>(),
      document_option<EuCliConfig>(),
      {"--articles", false, "Include the cited EU articles",
       [](EuCliConfig& c, const std::string&) {
         c.include_articles = true;
         return true;
       }},
      {"--reference-type", true, "Only this reference type (repeatable)",
       [](EuCliConfig& c, const std::string& v) {
         c.reference_types.push_back(v);
         return true;
       }},
  };
  const auto parsed = lexcite::apps::parse_options(argc, argv, options);
  const auto& config = parsed.config;
  if (!parsed.ok || !parsed.positionals.empty() || !config.db_path.has_value() ||
      !config.document_id.has_value()) {
    std::cerr << "Usage: lexcite_cli eu-basis --db <path> --document <id> [--articles] "
                 "[--reference-type <t>]...\n";
    return lexcite::apps::kExitUsage;
  }

  auto db = open_database(*config.db_path);
  if (!db || !check_registry_tables(*db, *config.db_path)) {
    return lexcite::apps::kExitFailure;
  }
  const SqliteDocumentStore store(db);
  const SqliteEuReferenceStore eu_store(db);

  lexcite::app::GetEuBasisRequest request;
  request.document_id = *config.document_id;
  request.include_articles = config.include_articles;
  request.reference_types = config.reference_types;
  return print_result(lexcite::app::get_eu_basis(store, eu_store, request),
                      lexcite::app::eu_basis_report_to_json);
}

int cmd_provision_eu_basis(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  const std::vector<lexcite::apps::Option<EuCliConfig>> options = {
      db_option<EuCliConfig>(),
      document_option<EuCliConfig>(),
      provision_ref_option(),
  };
  const auto parsed = lexcite::apps::parse_options(argc, argv, options);
  const auto& config = parsed.config;
  if (!parsed.ok || !parsed.positionals.empty() || !config.db_path.has_value() ||
      !config.document_id.has_value() || !config.provision_ref.has_value()) {
    std::cerr << "Usage: lexcite_cli provision-eu-basis --db <path> --document <id> "
                 "--provision-ref <r>\n";
    return lexcite::apps::kExitUsage;
  }

  auto db = open_database(*config.db_path);
  if (!db || !check_registry_tables(*db, *config.db_path)) {
    return lexcite::apps::kExitFailure;
  }
  const SqliteDocumentStore store(db);
  const SqliteEuReferenceStore eu_store(db);

  return print_result(lexcite::app::get_provision_eu_basis(
                          store, eu_store, {*config.document_id, *config.provision_ref}),
                      lexcite::app::provision_eu_basis_to_json);
}

int cmd_eu_implementations(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  const std::vector<lexcite::apps::Option<EuCliConfig>> options = {
      db_option<EuCliConfig>(),
      {"--primary-only", false, "Only primary implementations",
       [](EuCliConfig& c, const std::string&) {
         c.primary_only = true;
         return true;
       }},
      {"--in-force-only", false, "Only statutes in force",
       [](EuCliConfig& c, const std::string&) {
         c.in_force_only = true;
         return true;
       }},
  };
  const auto parsed = lexcite::apps::parse_options(argc, argv, options);
  const auto& config = parsed.config;
  if (!parsed.ok || parsed.positionals.size() != 1 || !config.db_path.has_value()) {
    std::cerr << "Usage: lexcite_cli eu-implementations <eu-document-id> --db <path> "
                 "[--primary-only] [--in-force-only]\n";
    return lexcite::apps::kExitUsage;
  }

  auto db = open_database(*config.db_path);
  if (!db || !check_registry_tables(*db, *config.db_path)) {
    return lexcite::apps::kExitFailure;
  }
  const SqliteDocumentStore store(db);
  const SqliteEuReferenceStore eu_store(db);

  lexcite::app::GetAustrianImplementationsRequest request;
  request.eu_document_id = parsed.positionals.front();
  request.primary_only = config.primary_only;
  request.in_force_only = config.in_force_only;
  return print_result(lexcite::app::get_austrian_implementations(store, eu_store, request),
                      lexcite::app::implementation_report_to_json);
}

int cmd_search_eu(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  const std::vector<lexcite::apps::Option<SearchEuCliConfig>> options = {
      db_option<SearchEuCliConfig>(),
      {"--query", true, "Substring of the EU document ID, title or short name",
       [](SearchEuCliConfig& c, const std::string& v) {
         c.request.query = v;
         return true;
       }},
      {"--type", true, "directive or regulation",
       [](SearchEuCliConfig& c, const std::string& v) {
         c.request.type = v;
         return true;
       }},
      {"--community", true, "EU, EG or EWG",
       [](SearchEuCliConfig& c, const std::string& v) {
         c.request.community = v;
         return true;
       }},
      {"--year-from", true, "Earliest year",
       [](SearchEuCliConfig& c, const std::string& v) {
         return parse_year("--year-from", v, c.request.year_from);
       }},
      {"--year-to", true, "Latest year",
       [](SearchEuCliConfig& c, const std::string& v) {
         return parse_year("--year-to", v, c.request.year_to);
       }},
      {"--implemented", false, "Only EU documents with an Austrian implementation",
       [](SearchEuCliConfig& c, const std::string&) {
         c.request.has_austrian_implementation = true;
         return true;
       }},
      {"--not-implemented", false, "Only EU documents without an Austrian implementation",
       [](SearchEuCliConfig& c, const std::string&) {
         c.request.has_austrian_implementation = false;
         return true;
       }},
      {"--limit", true, "Maximum results, 1-100 (default 20)",
       [](SearchEuCliConfig& c, const std::string& v) {
         if (!parse_int(v, c.request.limit)) {
           std::cerr << "Invalid --limit: " << v << " (expected an integer)\n";
           return false;
         }
         return true;
       }},
  };
  const auto parsed = lexcite::apps::parse_options(argc, argv, options);
  const auto& config = parsed.config;
  if (!parsed.ok || !parsed.positionals.empty() || !config.db_path.has_value()) {
    std::cerr << "Usage: lexcite_cli search-eu --db <path> [--query <q>] "
                 "[--type directive|regulation] [--community <c>] [--year-from <y>] "
                 "[--year-to <y>] [--implemented|--not-implemented] [--limit <n>]\n";
    return lexcite::apps::kExitUsage;
  }

  auto db = open_database(*config.db_path);
  if (!db) {
    return lexcite::apps::kExitFailure;
  }
  const SqliteEuReferenceStore eu_store(db);

  return print_result(lexcite::app::search_eu_implementations(eu_store, config.request),
                      lexcite::app::eu_implementation_summaries_to_json);
}

int cmd_eu_compliance(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  const std::vector<lexcite::apps::Option<EuCliConfig>> options = {
      db_option<EuCliConfig>(),
      document_option<EuCliConfig>(),
      provision_ref_option(),
      {"--eu-document", true, "Only references to this EU document",
       [](EuCliConfig& c, const std::string& v) {
         c.eu_document_id = v;
         return true;
       }},
  };
  const auto parsed = lexcite::apps::parse_options(argc, argv, options);
  const auto& config = parsed.config;
  if (!parsed.ok || !parsed.positionals.empty() || !config.db_path.has_value() ||
      !config.document_id.has_value()) {
    std::cerr << "Usage: lexcite_cli eu-compliance --db <path> --document <id> "
                 "[--provision-ref <r>] [--eu-document <id>]\n";
    return lexcite::apps::kExitUsage;
  }

  auto db = open_database(*config.db_path);
  if (!db || !check_registry_tables(*db, *config.db_path)) {
    return lexcite::apps::kExitFailure;
  }
  const SqliteDocumentStore store(db);
  const SqliteEuReferenceStore eu_store(db);

  return print_result(
      lexcite::app::validate_eu_compliance(
          store, eu_store, {*config.document_id, config.provision_ref, config.eu_document_id}),
      lexcite::app::compliance_report_to_json);
}
