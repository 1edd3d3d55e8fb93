#include "lexcite/citation/citation_validator.h"

#include "lexcite/citation/citation_parser.h"
#include "lexcite/citation/provision_candidates.h"
#include "lexcite/core/normalization.h"

#include <optional>
#include <string>
#include <vector>

namespace lexcite::citation {

namespace {

bool is_word_byte(const char ch) {
  const auto byte = static_cast<unsigned char>(ch);
  return (ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z') || (ch >= '0' && ch <= '9') ||
         ch == '_' || byte >= 0x80;
}

bool is_digit(const char ch) { return ch >= '0' && ch <= '9'; }

// Finds "<prefix><digits>" as a whole word, matching the prefix literally and
// ASCII case-insensitively.
std::optional<std::string> find_explicit_document_id(const std::string_view citation,
                                                     const std::string& prefix) {
  if (prefix.empty()) {
    return std::nullopt;
  }
  const std::string haystack = core::normalize_ascii_lower(citation);
  const std::string needle = core::normalize_ascii_lower(prefix);

  for (auto pos = haystack.find(needle); pos != std::string::npos;
       pos = haystack.find(needle, pos + 1)) {
    if (pos > 0 && is_word_byte(citation[pos - 1])) {
      continue;
    }
    auto end = pos + needle.size();
    const auto digits_start = end;
    while (end < citation.size() && is_digit(citation[end])) {
      ++end;
    }
    if (end == digits_start || (end < citation.size() && is_word_byte(citation[end]))) {
      continue;
    }
    return std::string{citation.substr(pos, end - pos)};
  }
  return std::nullopt;
}

domain::ValidationResult document_missing(domain::ParsedCitation parsed, std::string warning) {
  return domain::ValidationResult{std::move(parsed), false, false, std::nullopt, std::nullopt,
                                  {std::move(warning)}};
}

}  // namespace

domain::ValidationResult validate_citation(const std::string_view citation,
                                           const storage::IDocumentStore& store,
                                           const ValidatorOptions& options) {
  domain::ParsedCitation parsed = parse_citation(citation);
  if (!parsed.valid()) {
    std::string error = parsed.error();
    return document_missing(std::move(parsed), std::move(error));
  }

  const auto& reference = parsed.reference();
  std::optional<std::string> lookup_term = reference.title;
  if (!lookup_term) {
    lookup_term = find_explicit_document_id(citation, options.document_id_prefix);
  }
  if (!lookup_term) {
    return document_missing(std::move(parsed),
                            "Citation must include either a statute title or statute ID (e.g. " +
                                options.document_id_prefix + "10001622).");
  }

  const auto resolved_id = store.resolve_id(*lookup_term);
  const auto document = resolved_id ? store.get_document(*resolved_id) : std::nullopt;
  if (!document) {
    return document_missing(std::move(parsed),
                            "Document \"" + *lookup_term + "\" not found in database");
  }

  std::vector<std::string> warnings;
  if (document->status == domain::kStatusRepealed) {
    warnings.emplace_back("This statute has been repealed");
  }

  bool provision_exists = true;
  if (!reference.section.empty()) {
    provision_exists =
        store.provision_exists(document->id, build_provision_candidates(reference.section));
    if (!provision_exists) {
      warnings.push_back("Section § " + reference.section + " not found in " + document->title);
    }
  }

  return domain::ValidationResult{std::move(parsed),  true,
                                  provision_exists,   document->title,
                                  document->status,   std::move(warnings)};
}

}  // namespace lexcite::citation
