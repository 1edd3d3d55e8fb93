#include "lexcite/text/content_cleaner.h"

#include "lexcite/core/normalization.h"
#include "lexcite/core/unicode_text.h"
#include "lexcite/text/line_hygiene.h"

#include <algorithm>
#include <string>
#include <utility>
#include <vector>

namespace lexcite::text {

namespace {

std::size_t count_code_points(const std::string_view text) {
  return static_cast<std::size_t>(std::count_if(text.begin(), text.end(), [](const char ch) {
    return (static_cast<unsigned char>(ch) & 0xC0U) != 0x80U;
  }));
}

std::string keyword_line_pattern(const std::size_t min_terms) {
  // Each term starts with a letter and holds only letters, spaces and hyphens.
  const std::size_t leading_terms = std::max<std::size_t>(min_terms, 2) - 1;
  return R"((?:\p{L}[\p{L}\s\-]*,\s*){)" + std::to_string(leading_terms) +
         R"(,}\p{L}[\p{L}\s\-]*,?)";
}

std::string function_word_pattern(const std::vector<std::string>& words) {
  if (words.empty()) {
    // Never matches.
    return R"((?!x)x)";
  }
  std::string alternatives;
  for (const auto& word : words) {
    if (!alternatives.empty()) {
      alternatives += '|';
    }
    alternatives += R"(\Q)" + word + R"(\E)";
  }
  return R"(\b(?:)" + alternatives + R"()\b)";
}

}  // namespace

CleanerProfile austrian_registry_profile() {
  CleanerProfile profile;
  profile.metadata_rules = {
      // "BGBl. Nr. 1/1930", "BGBl. I Nr. 104/2019 ...", "JGS Nr. 946/1811", "StGBl. Nr. 4/1945"
      {"publication_reference",
       R"((?:BGBl\.?\s*(?:[IVX]+\s+)?Nr\.\s*.+|JGS\s+Nr\.\s*.+|StGBl\.?\s*(?:Nr\.)?\s*.+))"},
      {"document_type", R"((?:BG|BVG|V|StF|GZ|Vertrag\s+–\s+.+))"},
      // Duplicates the structured section column.
      {"section_marker", R"((?:§\s*[0-9]+\w*|Art\.?\s*[0-9]+\w*|Anl\.?\s*[0-9]+\w*))"},
      // "32/01 Finanzverfahren, allgemeines Abgabenrecht"
      {"classification_index", R"([0-9]{2}/[0-9]{2}\s+[A-ZÄÖÜ].+)"},
      // "BAO", "ASVG", "B-VG"
      {"short_name", R"([A-ZÄÖÜ][A-ZÄÖÜa-zäöü\-]{0,8})"},
      {"nor_number", R"(NOR[0-9]+)"},
      // "N1193018808R"
      {"internal_id", R"(N[0-9]{5,}[A-Z])"},
      {"registry_number", R"([0-9]{7,8})"},
      {"date", R"([0-9]{2}\.[0-9]{2}\.[0-9]{4})"},
      {"amendment_reference", R"(.{0,60},\s*BGBl\.?\s*(?:Nr\.|I\s+Nr\.)\s*[0-9]+.*)"},
      // "Erstes Hauptstück.", "Zweiter Abschnitt"
      {"structural_heading",
       R"((?:Erst|Zweit|Dritt|Viert|Fünft|Sechst|Siebent|Acht|Neunt|Zehnt)(?:e[sr]?)\s+)"
       R"((?:Haupt(?:stück|teil)|Abschnitt|Teil|Buch)\.?)",
       true},
  };

  profile.keyword_block.min_terms = 3;
  profile.keyword_block.max_term_length = 40;
  profile.keyword_block.function_words = {
      "ist",    "sind",   "wird",  "werden", "hat",  "haben", "kann",
      "können", "soll",   "sollen", "darf",  "dürfen", "muss", "müssen",
      "gemäß",  "nach",   "durch", "auf",    "über", "bei",   "unter",
  };

  profile.trailing_marker_pattern = R"(\s+(?:§\s*[0-9]+\w*|Artikel\s*[0-9]+\w*)\.?\s*$)";
  return profile;
}

ContentCleaner::ContentCleaner(const CleanerProfile& profile)
    : max_term_length_(profile.keyword_block.max_term_length),
      keyword_line_(keyword_line_pattern(profile.keyword_block.min_terms)),
      function_word_(function_word_pattern(profile.keyword_block.function_words), true),
      trailing_marker_(profile.trailing_marker_pattern) {
  rules_.reserve(profile.metadata_rules.size());
  for (const auto& rule : profile.metadata_rules) {
    rules_.push_back(CompiledRule{rule.name,
                                  core::UnicodePattern(rule.pattern, rule.case_insensitive)});
  }
}

std::optional<std::string> ContentCleaner::matching_rule(const std::string_view line) const {
  const std::string trimmed = core::trim(line);
  for (const auto& rule : rules_) {
    if (rule.pattern.matches(trimmed)) {
      return rule.name;
    }
  }
  return std::nullopt;
}

bool ContentCleaner::is_keyword_line(const std::string_view line) const {
  const std::string trimmed = core::trim(line);
  if (!keyword_line_.matches(trimmed)) {
    return false;
  }

  std::size_t start = 0;
  while (start <= trimmed.size()) {
    auto comma = trimmed.find(',', start);
    if (comma == std::string::npos) {
      comma = trimmed.size();
    }
    const std::string term = core::trim(std::string_view(trimmed).substr(start, comma - start));
    if (count_code_points(term) > max_term_length_) {
      return false;
    }
    start = comma + 1;
  }

  // Legal sentences carry verbs and prepositions; index keywords do not.
  return !function_word_.search(trimmed);
}

std::string ContentCleaner::clean_once(const std::string& text) const {
  std::vector<std::string> lines;
  for (auto& line : core::split_lines(text)) {
    const std::string trimmed = core::trim(line);
    if (trimmed.empty() || matching_rule(trimmed).has_value()) {
      continue;
    }
    lines.push_back(std::move(line));
  }

  while (!lines.empty() && is_keyword_line(lines.back())) {
    lines.pop_back();
  }

  std::string cleaned = core::trim(core::join_lines(lines));
  cleaned = trailing_marker_.replace_all(cleaned, "");
  cleaned = hygiene::collapse_blank_lines(cleaned, 1);
  return core::trim(cleaned);
}

std::string ContentCleaner::clean(const std::string_view raw) const {
  std::string current =
      hygiene::trim_trailing_whitespace(hygiene::normalize_line_endings(std::string(raw)));

  // Each pass only removes text, so this reaches a fixed point.
  while (true) {
    std::string next = clean_once(current);
    if (next == current) {
      return next;
    }
    current = std::move(next);
  }
}

std::string clean_provision_content(const std::string_view raw) {
  static const ContentCleaner kCleaner(austrian_registry_profile());
  return kCleaner.clean(raw);
}

}  // namespace lexcite::text
