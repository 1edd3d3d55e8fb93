#pragma once

#include "lexcite/domain/search.h"

#include <optional>
#include <string>
#include <string_view>

namespace lexcite::text {

// has_explicit_fts_syntax reports whether the query deliberately uses FTS5
// syntax: a quote character, AND/OR/NOT as whole upper-case words, or a
// trailing '*'.
[[nodiscard]] bool has_explicit_fts_syntax(std::string_view query);

// build_sanitized_fallback strips FTS5 operators from the query and returns
// the surviving tokens as quoted prefix terms joined by OR, e.g.
// "Daten* AND (Schutz" -> "\"Daten\"* OR \"Schutz\"*". nullopt when no token
// survives.
[[nodiscard]] std::optional<std::string> build_sanitized_fallback(std::string_view query);

// build_fts_query_variants turns raw user input into FTS5 expressions.
//
// Explicit syntax is passed through untouched as primary, with the
// sanitized fallback in case it fails to parse. Plain input becomes quoted
// prefix terms joined by implicit AND ("\"Daten\"* \"Schutz\"*") with an OR
// fallback for when the strict form finds nothing. Input that sanitizes to
// nothing is returned trimmed as primary with no fallback.
[[nodiscard]] domain::FtsQueryVariants build_fts_query_variants(std::string_view query);

}  // namespace lexcite::text
