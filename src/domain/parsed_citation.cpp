#include "lexcite/domain/parsed_citation.h"

#include "lexcite/core/normalization.h"
#include "lexcite/core/unicode_text.h"

namespace lexcite::domain {

std::string citation_kind_to_string(const CitationKind kind) {
  switch (kind) {
    case CitationKind::kStatute:
      return "statute";
    case CitationKind::kStatutoryInstrument:
      return "statutory_instrument";
    case CitationKind::kUnknown:
      return "unknown";
  }
  return "unknown";
}

CitationStyle citation_style_from_string(const std::string_view style) {
  const std::string normalized = core::normalize_ascii_lower(core::trim(style));
  if (normalized == "short") {
    return CitationStyle::kShort;
  }
  if (normalized == "pinpoint") {
    return CitationStyle::kPinpoint;
  }
  return CitationStyle::kFull;
}

}  // namespace lexcite::domain
