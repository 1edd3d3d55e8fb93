#include "text_commands.h"

#include "lexcite/domain/json.h"
#include "lexcite/text/content_cleaner.h"
#include "lexcite/text/fts_query.h"

#include "common.h"
#include "shared/arg_parser.h"
#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace {

struct CleanCliConfig {
  std::optional<std::string> file_path;
};

struct NoOptions {};

std::string read_all(std::istream& in) {
  std::ostringstream buffer;
  buffer << in.rdbuf();
  return buffer.str();
}

}  // namespace

int cmd_clean(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  const std::vector<lexcite::apps::Option<CleanCliConfig>> options = {
      {"--file", true, "Read provision text from a file instead of stdin",
       [](CleanCliConfig& c, const std::string& v) {
         c.file_path = v;
         return true;
       }},
  };
  const auto parsed = lexcite::apps::parse_options(argc, argv, options);
  if (!parsed.ok || !parsed.positionals.empty()) {
    std::cerr << "Usage: lexcite_cli clean [--file <path>]\n";
    return lexcite::apps::kExitUsage;
  }

  std::string raw;
  if (parsed.config.file_path.has_value()) {
    std::ifstream file(*parsed.config.file_path, std::ios::binary);
    if (!file) {
      std::cerr << "Failed to open file: " << *parsed.config.file_path << "\n";
      return lexcite::apps::kExitFailure;
    }
    raw = read_all(file);
  } else {
    raw = read_all(std::cin);
  }

  std::cout << lexcite::text::clean_provision_content(raw) << "\n";
  return lexcite::apps::kExitOk;
}

int cmd_fts(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  const auto parsed = lexcite::apps::parse_options<NoOptions>(argc, argv, {});
  if (!parsed.ok || parsed.positionals.size() != 1) {
    std::cerr << "Usage: lexcite_cli fts <query>\n";
    return lexcite::apps::kExitUsage;
  }

  const std::string& query = parsed.positionals.front();
  nlohmann::json j = lexcite::domain::fts_query_variants_to_json(
      lexcite::text::build_fts_query_variants(query));
  j["explicit_syntax"] = lexcite::text::has_explicit_fts_syntax(query);
  print_json(j);
  return lexcite::apps::kExitOk;
}
