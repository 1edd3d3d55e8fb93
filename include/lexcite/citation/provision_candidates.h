#pragma once

#include "lexcite/domain/provision_candidates.h"

#include <string_view>

namespace lexcite::citation {

// build_provision_candidates normalizes a loose provision reference
// ("§ 4a", "Paragraph 4a", "para4a", "4a") into every key the registry may
// store it under:
//   canonical_section  "4a"
//   provision_refs     {"para4a"}
//   sections           {"§ 4a", "4a"}
// Letter suffixes are also offered in lowercase ("4A" adds "para4a", "4a").
// Empty or marker-only input yields an empty set.
[[nodiscard]] domain::ProvisionCandidateSet build_provision_candidates(std::string_view ref);

}  // namespace lexcite::citation
