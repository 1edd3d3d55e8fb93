#pragma once

#include "lexcite/domain/parsed_citation.h"

#include <string>
#include <string_view>

namespace lexcite::citation {

// format_citation renders a parsed citation:
//   kFull:     "§ 3(1)(a), Datenschutzgesetz 2018"
//   kShort:    "§ 3(1)(a) Datenschutzgesetz"
//   kPinpoint: "§ 3(1)(a)"
// An invalid citation formats to the empty string.
[[nodiscard]] std::string format_citation(
    const domain::ParsedCitation& citation,
    domain::CitationStyle style = domain::CitationStyle::kFull);

// format_citation_text parses raw and formats the result in one step.
[[nodiscard]] std::string format_citation_text(
    std::string_view raw, domain::CitationStyle style = domain::CitationStyle::kFull);

}  // namespace lexcite::citation
