#pragma once

#include "lexcite/core/unicode_pattern.h"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace lexcite::text {

// MetadataLineRule names one whole-line shape of registry metadata.
// pattern is an ICU regular expression that must match the entire trimmed
// line; a line merely containing the shape is legal text and is kept.
struct MetadataLineRule {
  std::string name;
  std::string pattern;
  bool case_insensitive{false};
};

// KeywordBlockSettings tunes the trailing index-keyword heuristic.
// A keyword line is a comma-separated list of at least min_terms letter-only
// terms, none longer than max_term_length code points, containing none of
// function_words (matched as whole words, case-insensitively).
//
// The defaults are calibrated to German registry text. Other jurisdictions
// need their own term length and function-word list.
struct KeywordBlockSettings {
  std::size_t min_terms{3};
  std::size_t max_term_length{40};
  std::vector<std::string> function_words;
};

// CleanerProfile is the complete configuration of a ContentCleaner.
struct CleanerProfile {
  std::vector<MetadataLineRule> metadata_rules;  // evaluated in order
  KeywordBlockSettings keyword_block;
  // Section marker appended to the last content line ("... aus. § 1.").
  std::string trailing_marker_pattern;
};

// austrian_registry_profile returns the rule set for RIS (Austrian legal
// information system) provision text.
[[nodiscard]] CleanerProfile austrian_registry_profile();

// ContentCleaner strips embedded registry metadata from provision text:
//   1. drops blank lines and lines matching any metadata rule
//   2. drops trailing index-keyword lines, working backwards
//   3. removes a trailing section marker, collapses blank lines, trims
// The steps repeat until the text stops changing, so clean(clean(x)) ==
// clean(x). Never throws once constructed.
class ContentCleaner {
 public:
  // Throws std::invalid_argument when a profile pattern does not compile.
  explicit ContentCleaner(const CleanerProfile& profile);

  [[nodiscard]] std::string clean(std::string_view raw) const;

  // Name of the first metadata rule matching the trimmed line, if any.
  [[nodiscard]] std::optional<std::string> matching_rule(std::string_view line) const;

  [[nodiscard]] bool is_keyword_line(std::string_view line) const;

 private:
  struct CompiledRule {
    std::string name;
    core::UnicodePattern pattern;
  };

  [[nodiscard]] std::string clean_once(const std::string& text) const;

  std::vector<CompiledRule> rules_;
  std::size_t max_term_length_;
  core::UnicodePattern keyword_line_;
  core::UnicodePattern function_word_;
  core::UnicodePattern trailing_marker_;
};

// clean_provision_content cleans with the Austrian registry profile.
[[nodiscard]] std::string clean_provision_content(std::string_view raw);

}  // namespace lexcite::text
