#pragma once

#include "lexcite/domain/eu_reference.h"
#include "lexcite/domain/legal_document.h"
#include "lexcite/domain/parsed_citation.h"
#include "lexcite/domain/provision_candidates.h"
#include "lexcite/domain/search.h"
#include "lexcite/domain/validation_result.h"

#include <nlohmann/json.hpp>

namespace lexcite::domain {

// JSON renderings of the engine's value types. Absent optional fields are
// omitted rather than written as null.

// {"valid": true, "type": "statute", "title": ..., "year": ..., "section": ...,
//  "subsection": ..., "paragraph": ...} or {"valid": false, "error": ...}
[[nodiscard]] nlohmann::json parsed_citation_to_json(const ParsedCitation& citation);

[[nodiscard]] nlohmann::json provision_candidates_to_json(const ProvisionCandidateSet& candidates);
[[nodiscard]] nlohmann::json fts_query_variants_to_json(const FtsQueryVariants& variants);

// The citation's own fields are nested under "citation".
[[nodiscard]] nlohmann::json validation_result_to_json(const ValidationResult& result);

[[nodiscard]] nlohmann::json legal_document_to_json(const LegalDocument& document);
[[nodiscard]] nlohmann::json provision_to_json(const Provision& provision);
[[nodiscard]] nlohmann::json search_hit_to_json(const SearchHit& hit);

[[nodiscard]] nlohmann::json eu_document_to_json(const EuDocument& document);

// {"id", "type", "title", "short_name", "article", "reference_type",
//  "is_primary_implementation", "full_citation", "context"}. full_citation
// falls back to the EU document ID.
[[nodiscard]] nlohmann::json eu_reference_to_json(const EuReference& reference);

}  // namespace lexcite::domain
