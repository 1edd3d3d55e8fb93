#include "lexcite/citation/citation_formatter.h"

#include "lexcite/citation/citation_parser.h"

namespace lexcite::citation {

namespace {

std::string pinpoint(const domain::CitationReference& reference) {
  std::string out = "§ " + reference.section;
  if (reference.subsection) {
    out += "(" + *reference.subsection + ")";
  }
  if (reference.paragraph) {
    out += "(" + *reference.paragraph + ")";
  }
  return out;
}

std::string full(const domain::CitationReference& reference) {
  std::string title_and_year = reference.title.value_or("");
  if (reference.year) {
    if (!title_and_year.empty()) {
      title_and_year += ' ';
    }
    title_and_year += std::to_string(*reference.year);
  }
  if (title_and_year.empty()) {
    return pinpoint(reference);
  }
  return pinpoint(reference) + ", " + title_and_year;
}

}  // namespace

std::string format_citation(const domain::ParsedCitation& citation,
                            const domain::CitationStyle style) {
  if (!citation.valid() || citation.reference().section.empty()) {
    return {};
  }

  const auto& reference = citation.reference();
  switch (style) {
    case domain::CitationStyle::kFull:
      return full(reference);
    case domain::CitationStyle::kShort:
      return reference.title ? pinpoint(reference) + " " + *reference.title : pinpoint(reference);
    case domain::CitationStyle::kPinpoint:
      return pinpoint(reference);
  }
  return full(reference);
}

std::string format_citation_text(const std::string_view raw, const domain::CitationStyle style) {
  return format_citation(parse_citation(raw), style);
}

}  // namespace lexcite::citation
