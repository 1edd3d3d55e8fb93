#pragma once

#include "lexcite/core/ids.h"

#include <optional>
#include <string>

namespace lexcite::domain {

// FtsQueryVariants holds the full-text expressions for one user query.
// primary is tried first; fallback, when present, always parses under the
// FTS5 query grammar and is tried when primary is rejected or finds nothing.
struct FtsQueryVariants {
  std::string primary;
  std::optional<std::string> fallback;

  bool operator==(const FtsQueryVariants&) const = default;
};

// SearchFilter narrows a full-text search. document_id must already be a
// resolved canonical ID.
struct SearchFilter {
  std::optional<core::DocumentId> document_id;
  std::optional<std::string> status;
  int limit{10};
};

struct SearchHit {
  core::DocumentId document_id;
  std::string document_title;
  std::string provision_ref;
  std::string section;
  std::string snippet;  // matched terms wrapped in >>> <<<
  double relevance{0.0};
};

}  // namespace lexcite::domain
