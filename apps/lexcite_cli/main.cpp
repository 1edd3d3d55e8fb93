#include "lexcite/core/version.h"

#include "commands/citation_commands.h"
#include "commands/eu_commands.h"
#include "commands/lookup_commands.h"
#include "commands/registry_commands.h"
#include "commands/text_commands.h"
#include "shared/arg_parser.h"
#include <exception>
#include <iostream>
#include <string>

namespace {

using CommandFn = int (*)(int, char**);

struct Command {
  const char* name;
  CommandFn run;
  const char* summary;
};

constexpr Command kCommands[] = {
    {"parse", cmd_parse, "Parse a citation into its parts"},
    {"format", cmd_format, "Print a citation in canonical form"},
    {"candidates", cmd_candidates, "List the stored keys a provision reference may match"},
    {"validate", cmd_validate, "Check a citation against the registry"},
    {"clean", cmd_clean, "Strip registry metadata from provision text"},
    {"fts", cmd_fts, "Show the FTS5 expressions built for a query"},
    {"get-provision", cmd_get_provision, "Fetch provision text"},
    {"check-currency", cmd_check_currency, "Report whether a statute is in force"},
    {"search", cmd_search, "Full-text search over provisions"},
    {"eu-basis", cmd_eu_basis, "List the EU law a statute refers to"},
    {"provision-eu-basis", cmd_provision_eu_basis, "List the EU references of one provision"},
    {"eu-implementations", cmd_eu_implementations,
     "List the Austrian statutes referring to an EU document"},
    {"search-eu", cmd_search_eu, "Search EU documents and their Austrian implementations"},
    {"eu-compliance", cmd_eu_compliance, "Grade the recorded EU references of a statute"},
    {"list-sources", cmd_list_sources, "Show data provenance and registry metadata"},
    {"about", cmd_about, "Describe lexcite and the opened dataset"},
};

void print_usage() {
  std::cerr << "lexcite " << lexcite::core::kBuildVersion << "\n"
            << "Usage: lexcite_cli <command> [args]\n\nCommands:\n";
  for (const auto& command : kCommands) {
    std::cerr << "  " << command.name << "  " << command.summary << "\n";
  }
}

}  // namespace

int main(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  if (argc < 2) {
    print_usage();
    return lexcite::apps::kExitUsage;
  }

  const std::string subcommand = argv[1];
  if (subcommand == "--help" || subcommand == "-h" || subcommand == "help") {
    print_usage();
    return lexcite::apps::kExitOk;
  }

  for (const auto& command : kCommands) {
    if (subcommand == command.name) {
      try {
        return command.run(argc, argv);
      } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return lexcite::apps::kExitFailure;
      }
    }
  }

  std::cerr << "Unknown command: " << subcommand << "\n";
  print_usage();
  return lexcite::apps::kExitUsage;
}
