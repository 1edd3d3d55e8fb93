#include "citation_commands.h"

#include "lexcite/citation/citation_formatter.h"
#include "lexcite/citation/citation_parser.h"
#include "lexcite/citation/citation_validator.h"
#include "lexcite/citation/provision_candidates.h"
#include "lexcite/core/normalization.h"
#include "lexcite/domain/json.h"

#include "common.h"
#include "shared/arg_parser.h"
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace {

struct NoOptions {};

struct FormatCliConfig {
  lexcite::domain::CitationStyle style{lexcite::domain::CitationStyle::kFull};
};

struct ValidateCliConfig {
  std::optional<std::string> db_path;
  lexcite::citation::ValidatorOptions validator;
};

// single_positional returns the one positional argument, or prints usage.
std::optional<std::string> single_positional(const std::vector<std::string>& positionals,
                                             const char* usage) {
  if (positionals.size() != 1) {
    std::cerr << "Usage: " << usage << "\n";
    return std::nullopt;
  }
  return positionals.front();
}

}  // namespace

int cmd_parse(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  const auto parsed = lexcite::apps::parse_options<NoOptions>(argc, argv, {});
  const auto citation = single_positional(parsed.positionals, "lexcite_cli parse <citation>");
  if (!parsed.ok || !citation.has_value()) {
    return lexcite::apps::kExitUsage;
  }

  print_json(lexcite::domain::parsed_citation_to_json(lexcite::citation::parse_citation(*citation)));
  return lexcite::apps::kExitOk;
}

int cmd_format(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  const std::vector<lexcite::apps::Option<FormatCliConfig>> options = {
      {"--style", true, "full, short or pinpoint (default full)",
       [](FormatCliConfig& c, const std::string& v) {
         const std::string style = lexcite::core::normalize_ascii_lower(v);
         if (style != "full" && style != "short" && style != "pinpoint") {
           std::cerr << "Invalid --style: " << v << " (valid: full, short, pinpoint)\n";
           return false;
         }
         c.style = lexcite::domain::citation_style_from_string(style);
         return true;
       }},
  };
  const auto parsed = lexcite::apps::parse_options(argc, argv, options);
  const auto citation = single_positional(
      parsed.positionals, "lexcite_cli format <citation> [--style full|short|pinpoint]");
  if (!parsed.ok || !citation.has_value()) {
    return lexcite::apps::kExitUsage;
  }

  const auto result = lexcite::citation::parse_citation(*citation);
  nlohmann::json j;
  j["valid"] = result.valid();
  if (!result.valid()) {
    j["error"] = result.error();
    print_json(j);
    return lexcite::apps::kExitFailure;
  }
  j["formatted"] = lexcite::citation::format_citation(result, parsed.config.style);
  print_json(j);
  return lexcite::apps::kExitOk;
}

int cmd_candidates(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  const auto parsed = lexcite::apps::parse_options<NoOptions>(argc, argv, {});
  const auto ref = single_positional(parsed.positionals, "lexcite_cli candidates <ref>");
  if (!parsed.ok || !ref.has_value()) {
    return lexcite::apps::kExitUsage;
  }

  print_json(lexcite::domain::provision_candidates_to_json(
      lexcite::citation::build_provision_candidates(*ref)));
  return lexcite::apps::kExitOk;
}

int cmd_validate(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  const std::vector<lexcite::apps::Option<ValidateCliConfig>> options = {
      {"--db", true, "Path to the registry SQLite database",
       [](ValidateCliConfig& c, const std::string& v) {
         c.db_path = v;
         return true;
       }},
      {"--id-prefix", true, "Prefix of canonical document IDs (default gesetz-)",
       [](ValidateCliConfig& c, const std::string& v) {
         if (v.empty()) {
           std::cerr << "Invalid --id-prefix: must not be empty\n";
           return false;
         }
         c.validator.document_id_prefix = v;
         return true;
       }},
  };
  const auto parsed = lexcite::apps::parse_options(argc, argv, options);
  const char* usage = "lexcite_cli validate <citation> --db <path> [--id-prefix <prefix>]";
  const auto citation = single_positional(parsed.positionals, usage);
  if (!parsed.ok || !citation.has_value()) {
    return lexcite::apps::kExitUsage;
  }
  if (!parsed.config.db_path.has_value()) {
    std::cerr << "Error: --db <path> is required\n";
    return lexcite::apps::kExitUsage;
  }

  auto store = open_registry(*parsed.config.db_path);
  if (!store) {
    return lexcite::apps::kExitFailure;
  }

  const auto result =
      lexcite::citation::validate_citation(*citation, *store, parsed.config.validator);
  print_json(lexcite::domain::validation_result_to_json(result));
  return lexcite::apps::kExitOk;
}
