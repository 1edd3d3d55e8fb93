#pragma once

#include "lexcite/domain/parsed_citation.h"

#include <string_view>

namespace lexcite::citation {

// parse_citation parses a free-form Austrian (or legacy English) citation.
//
// Accepted forms, tried in this order (first match wins):
//   1. "§ 3(1)(a), Title"  / "Paragraph 3 Title"   section first
//   2. "Title § 3"                                  title first
//   3. "para3, Title"                               machine reference first
//   4. "Section 3, Title 2018" / "s. 3 Title"       legacy English
//   5. "para3"                                      bare machine reference
//   6. "§ 3"                                        bare section
//
// Keywords are case-insensitive. A title ending in a 4-digit token has that
// token split off as the year. Never throws: anything unrecognised yields an
// invalid ParsedCitation whose error describes the input.
[[nodiscard]] domain::ParsedCitation parse_citation(std::string_view raw);

}  // namespace lexcite::citation
