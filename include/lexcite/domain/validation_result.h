#pragma once

#include "lexcite/domain/parsed_citation.h"

#include <optional>
#include <string>
#include <vector>

namespace lexcite::domain {

// ValidationResult reports whether a citation refers to a document and
// provision that exist. provision_exists is never true while
// document_exists is false. warnings are display-ready sentences in the
// order they were raised.
struct ValidationResult {
  ParsedCitation citation;
  bool document_exists{false};
  bool provision_exists{false};
  std::optional<std::string> document_title;
  std::optional<std::string> status;
  std::vector<std::string> warnings;
};

}  // namespace lexcite::domain
