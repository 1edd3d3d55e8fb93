#pragma once

#include <string>
#include <vector>

namespace lexcite::domain {

// ProvisionCandidateSet enumerates every stored encoding of one provision
// reference. The registry keys a provision twice: a machine reference
// ("para4a") and a human section label ("§ 4a" or "4a"). A lookup matches
// when either column equals any entry of the corresponding list.
//
// An empty canonical_section means "no candidates": both lists are empty
// and no provision can match.
struct ProvisionCandidateSet {
  std::string canonical_section;
  std::vector<std::string> provision_refs;
  std::vector<std::string> sections;

  [[nodiscard]] bool empty() const { return provision_refs.empty() && sections.empty(); }

  bool operator==(const ProvisionCandidateSet&) const = default;
};

}  // namespace lexcite::domain
