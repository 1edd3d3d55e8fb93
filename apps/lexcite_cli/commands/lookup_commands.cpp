#include "lookup_commands.h"

#include "lexcite/app/legal_lookup.h"

#include "common.h"
#include "shared/arg_parser.h"
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace {

struct LookupCliConfig {
  std::optional<std::string> db_path;
  std::optional<std::string> document_id;
  std::optional<std::string> section;
  std::optional<std::string> provision_ref;
  std::optional<std::string> as_of_date;
};

struct SearchCliConfig {
  std::optional<std::string> db_path;
  std::optional<std::string> document_id;
  std::optional<std::string> status;
  int limit{lexcite::app::kDefaultSearchLimit};
};

}  // namespace

int cmd_get_provision(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  const std::vector<lexcite::apps::Option<LookupCliConfig>> options = {
      db_option<LookupCliConfig>(),
      document_option<LookupCliConfig>(),
      {"--section", true, "Section label, e.g. \"§ 4a\" or 4a",
       [](LookupCliConfig& c, const std::string& v) {
         c.section = v;
         return true;
       }},
      {"--provision-ref", true, "Provision reference, e.g. para4a",
       [](LookupCliConfig& c, const std::string& v) {
         c.provision_ref = v;
         return true;
       }},
  };
  const auto parsed = lexcite::apps::parse_options(argc, argv, options);
  const auto& config = parsed.config;
  if (!parsed.ok || !parsed.positionals.empty() || !config.db_path.has_value() ||
      !config.document_id.has_value()) {
    std::cerr << "Usage: lexcite_cli get-provision --db <path> --document <id> "
                 "[--section <s>] [--provision-ref <r>]\n";
    return lexcite::apps::kExitUsage;
  }

  auto store = open_registry(*config.db_path);
  if (!store) {
    return lexcite::apps::kExitFailure;
  }

  const auto result = lexcite::app::get_provision(
      *store, {*config.document_id, config.section, config.provision_ref});
  if (!result.has_value()) {
    std::cerr << "Error: " << result.error() << "\n";
    return lexcite::apps::kExitFailure;
  }
  print_json(lexcite::app::provision_lookup_to_json(result.value()));
  return lexcite::apps::kExitOk;
}

int cmd_check_currency(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  const std::vector<lexcite::apps::Option<LookupCliConfig>> options = {
      db_option<LookupCliConfig>(),
      document_option<LookupCliConfig>(),
      {"--provision-ref", true, "Provision to check, e.g. \"§ 4a\" or para4a",
       [](LookupCliConfig& c, const std::string& v) {
         c.provision_ref = v;
         return true;
       }},
      {"--as-of-date", true, "Reference date, YYYY-MM-DD",
       [](LookupCliConfig& c, const std::string& v) {
         c.as_of_date = v;
         return true;
       }},
  };
  const auto parsed = lexcite::apps::parse_options(argc, argv, options);
  const auto& config = parsed.config;
  if (!parsed.ok || !parsed.positionals.empty() || !config.db_path.has_value() ||
      !config.document_id.has_value()) {
    std::cerr << "Usage: lexcite_cli check-currency --db <path> --document <id> "
                 "[--provision-ref <r>] [--as-of-date <YYYY-MM-DD>]\n";
    return lexcite::apps::kExitUsage;
  }

  auto store = open_registry(*config.db_path);
  if (!store) {
    return lexcite::apps::kExitFailure;
  }

  const auto result = lexcite::app::check_currency(
      *store, {*config.document_id, config.provision_ref, config.as_of_date});
  if (!result.has_value()) {
    std::cerr << "Error: " << result.error() << "\n";
    return lexcite::apps::kExitFailure;
  }
  if (!result.value().has_value()) {
    std::cerr << "Document \"" << *config.document_id << "\" not found\n";
    return lexcite::apps::kExitFailure;
  }
  print_json(lexcite::app::currency_report_to_json(*result.value()));
  return lexcite::apps::kExitOk;
}

int cmd_search(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  const std::vector<lexcite::apps::Option<SearchCliConfig>> options = {
      db_option<SearchCliConfig>(),
      document_option<SearchCliConfig>(),
      {"--status", true, "Only documents with this status",
       [](SearchCliConfig& c, const std::string& v) {
         c.status = v;
         return true;
       }},
      {"--limit", true, "Maximum hits, 1-50 (default 10)",
       [](SearchCliConfig& c, const std::string& v) {
         if (!parse_int(v, c.limit)) {
           std::cerr << "Invalid --limit: " << v << " (expected an integer)\n";
           return false;
         }
         return true;
       }},
  };
  const auto parsed = lexcite::apps::parse_options(argc, argv, options);
  const auto& config = parsed.config;
  if (!parsed.ok || parsed.positionals.size() != 1 || !config.db_path.has_value()) {
    std::cerr << "Usage: lexcite_cli search <query> --db <path> [--document <id>] "
                 "[--status in_force|amended|repealed] [--limit <n>]\n";
    return lexcite::apps::kExitUsage;
  }

  auto store = open_registry(*config.db_path);
  if (!store) {
    return lexcite::apps::kExitFailure;
  }

  lexcite::app::SearchRequest request;
  request.query = parsed.positionals.front();
  request.document_id = config.document_id;
  request.status = config.status;
  request.limit = config.limit;

  const auto result = lexcite::app::search_legislation(*store, *store, request);
  if (!result.has_value()) {
    std::cerr << "Error: " << result.error() << "\n";
    return lexcite::apps::kExitFailure;
  }
  print_json(lexcite::app::search_outcome_to_json(result.value()));
  return lexcite::apps::kExitOk;
}
