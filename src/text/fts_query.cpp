#include "lexcite/text/fts_query.h"

#include "lexcite/core/unicode_pattern.h"
#include "lexcite/core/unicode_text.h"

#include <string>
#include <vector>

namespace lexcite::text {

namespace {

std::vector<std::string> sanitized_tokens(const std::string_view text) {
  std::vector<std::string> tokens;
  for (const auto& raw_token : core::split_whitespace(text)) {
    std::string token = core::keep_word_characters(raw_token);
    if (!token.empty()) {
      tokens.push_back(std::move(token));
    }
  }
  return tokens;
}

std::string join_prefix_terms(const std::vector<std::string>& tokens,
                              const std::string_view separator) {
  std::string out;
  for (const auto& token : tokens) {
    if (!out.empty()) {
      out += separator;
    }
    out += '"';
    out += token;
    out += "\"*";
  }
  return out;
}

}  // namespace

bool has_explicit_fts_syntax(const std::string_view query) {
  static const core::UnicodePattern kExplicitSyntax(R"(["“”„]|\bAND\b|\bOR\b|\bNOT\b|\*$)");
  return kExplicitSyntax.search(query);
}

std::optional<std::string> build_sanitized_fallback(const std::string_view query) {
  // Characters with a meaning in FTS5 query syntax.
  static const core::UnicodePattern kSpecialCharacters(R"(["“”„(){}^:+\-~])");

  const auto tokens = sanitized_tokens(kSpecialCharacters.replace_all(query, " "));
  if (tokens.empty()) {
    return std::nullopt;
  }
  return join_prefix_terms(tokens, " OR ");
}

domain::FtsQueryVariants build_fts_query_variants(const std::string_view query) {
  const std::string trimmed = core::trim(query);

  if (has_explicit_fts_syntax(trimmed)) {
    return {trimmed, build_sanitized_fallback(trimmed)};
  }

  const auto tokens = sanitized_tokens(trimmed);
  if (tokens.empty()) {
    return {trimmed, std::nullopt};
  }

  return {join_prefix_terms(tokens, " "), join_prefix_terms(tokens, " OR ")};
}

}  // namespace lexcite::text
