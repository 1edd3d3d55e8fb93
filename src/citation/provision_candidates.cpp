#include "lexcite/citation/provision_candidates.h"

#include "lexcite/core/normalization.h"
#include "lexcite/core/unicode_text.h"
#include "lexcite/core/unicode_pattern.h"

#include <algorithm>
#include <string>
#include <vector>

namespace lexcite::citation {

namespace {

void add_unique(std::vector<std::string>& keys, std::string key) {
  if (std::find(keys.begin(), keys.end(), key) == keys.end()) {
    keys.push_back(std::move(key));
  }
}

}  // namespace

domain::ProvisionCandidateSet build_provision_candidates(const std::string_view ref) {
  // Longer keywords first so "Paragraph" is not consumed as "para" + "graph".
  static const core::UnicodePattern kLeadingMarker(R"(^(?:§|Paragraph|Paragraf|para)\s*)",
                                                   true);

  domain::ProvisionCandidateSet candidates;
  candidates.canonical_section = core::trim(kLeadingMarker.replace_all(core::trim(ref), ""));
  if (candidates.canonical_section.empty()) {
    return candidates;
  }

  const std::string& canonical = candidates.canonical_section;
  const std::string lowered = core::normalize_ascii_lower(canonical);

  add_unique(candidates.provision_refs, "para" + canonical);
  add_unique(candidates.provision_refs, "para" + lowered);

  add_unique(candidates.sections, "§ " + canonical);
  add_unique(candidates.sections, canonical);
  add_unique(candidates.sections, "§ " + lowered);
  add_unique(candidates.sections, lowered);

  return candidates;
}

}  // namespace lexcite::citation
