#pragma once

#include "lexcite/core/ids.h"

#include <optional>
#include <string>

namespace lexcite::domain {

// EU document types as stored by the registry.
constexpr const char* kEuDirective = "directive";
constexpr const char* kEuRegulation = "regulation";

// EuDocument is a directive or regulation. id has the form
// "<type>:<year>/<number>", e.g. "regulation:2016/679".
struct EuDocument {
  std::string id;
  std::string type{kEuDirective};
  int year{0};
  std::optional<int> number;
  std::optional<std::string> community;  // "EU", "EG", "EWG"
  std::optional<std::string> celex_number;
  std::optional<std::string> title;
  std::optional<std::string> short_name;  // e.g. "GDPR"
  std::optional<std::string> url_eur_lex;
};

// EuReference links an Austrian statute, or one of its provisions, to an
// EU document. provision_ref is absent for statute-level references.
// reference_type is one of implements, supplements, applies, cites,
// cites_article.
struct EuReference {
  EuDocument eu_document;
  core::DocumentId statute_id;
  std::optional<std::string> provision_ref;
  std::optional<std::string> article;  // "Art. 6"
  std::string reference_type;
  bool is_primary_implementation{false};
  std::optional<std::string> full_citation;
  std::optional<std::string> context;
};

// EuDocumentFilter narrows search_eu_documents. query matches the ID, title
// or short name as an ASCII case-insensitive substring.
struct EuDocumentFilter {
  std::optional<std::string> query;
  std::optional<std::string> type;
  std::optional<std::string> community;
  std::optional<int> year_from;
  std::optional<int> year_to;
};

}  // namespace lexcite::domain
