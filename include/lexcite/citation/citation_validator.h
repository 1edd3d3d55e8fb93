#pragma once

#include "lexcite/domain/validation_result.h"
#include "lexcite/storage/document_store.h"

#include <string>
#include <string_view>

namespace lexcite::citation {

struct ValidatorOptions {
  // Prefix of canonical document IDs that may appear verbatim in a citation
  // ("§ 1 gesetz-10001622").
  std::string document_id_prefix{"gesetz-"};
};

// validate_citation checks a citation against the registry:
//   - unparseable input: document_exists=false, parser error as the warning
//   - lookup term: parsed title, else an explicit canonical ID in the input
//   - unresolved document: document_exists=false, "not found" warning
//   - repealed document: advisory warning, still document_exists=true
//   - with a section: provision looked up through its candidate keys
//   - without a section: provision_exists=true (document-level citation)
// Never throws; every outcome is a ValidationResult.
[[nodiscard]] domain::ValidationResult validate_citation(std::string_view citation,
                                                         const storage::IDocumentStore& store,
                                                         const ValidatorOptions& options = {});

}  // namespace lexcite::citation
