#include "lexcite/domain/json.h"

namespace lexcite::domain {

namespace {

template <typename T>
void put_optional(nlohmann::json& j, const char* key, const std::optional<T>& value) {
  if (value.has_value()) {
    j[key] = *value;
  }
}

}  // namespace

nlohmann::json parsed_citation_to_json(const ParsedCitation& citation) {
  nlohmann::json j;
  j["valid"] = citation.valid();
  if (!citation.valid()) {
    j["type"] = citation_kind_to_string(citation.kind());
    j["error"] = citation.error();
    return j;
  }

  const auto& ref = citation.reference();
  j["type"] = citation_kind_to_string(ref.kind);
  put_optional(j, "title", ref.title);
  put_optional(j, "year", ref.year);
  j["section"] = ref.section;
  put_optional(j, "subsection", ref.subsection);
  put_optional(j, "paragraph", ref.paragraph);
  return j;
}

nlohmann::json provision_candidates_to_json(const ProvisionCandidateSet& candidates) {
  nlohmann::json j;
  j["canonical_section"] = candidates.canonical_section;
  j["provision_refs"] = candidates.provision_refs;
  j["sections"] = candidates.sections;
  return j;
}

nlohmann::json fts_query_variants_to_json(const FtsQueryVariants& variants) {
  nlohmann::json j;
  j["primary"] = variants.primary;
  put_optional(j, "fallback", variants.fallback);
  return j;
}

nlohmann::json validation_result_to_json(const ValidationResult& result) {
  nlohmann::json j;
  j["citation"] = parsed_citation_to_json(result.citation);
  j["document_exists"] = result.document_exists;
  j["provision_exists"] = result.provision_exists;
  put_optional(j, "document_title", result.document_title);
  put_optional(j, "status", result.status);
  j["warnings"] = result.warnings;
  return j;
}

nlohmann::json legal_document_to_json(const LegalDocument& document) {
  nlohmann::json j;
  j["id"] = document.id.value;
  j["title"] = document.title;
  put_optional(j, "short_name", document.short_name);
  j["status"] = document.status;
  j["type"] = document.type;
  put_optional(j, "issued_date", document.issued_date);
  put_optional(j, "in_force_date", document.in_force_date);
  return j;
}

nlohmann::json provision_to_json(const Provision& provision) {
  nlohmann::json j;
  j["document_id"] = provision.document_id.value;
  j["provision_ref"] = provision.provision_ref;
  put_optional(j, "chapter", provision.chapter);
  j["section"] = provision.section;
  put_optional(j, "title", provision.title);
  j["content"] = provision.content;
  j["order_index"] = provision.order_index;
  return j;
}

nlohmann::json search_hit_to_json(const SearchHit& hit) {
  nlohmann::json j;
  j["document_id"] = hit.document_id.value;
  j["document_title"] = hit.document_title;
  j["provision_ref"] = hit.provision_ref;
  j["section"] = hit.section;
  j["snippet"] = hit.snippet;
  j["relevance"] = hit.relevance;
  return j;
}

nlohmann::json eu_document_to_json(const EuDocument& document) {
  nlohmann::json j;
  j["id"] = document.id;
  j["type"] = document.type;
  j["year"] = document.year;
  put_optional(j, "number", document.number);
  put_optional(j, "community", document.community);
  put_optional(j, "celex_number", document.celex_number);
  put_optional(j, "title", document.title);
  put_optional(j, "short_name", document.short_name);
  put_optional(j, "url_eur_lex", document.url_eur_lex);
  return j;
}

nlohmann::json eu_reference_to_json(const EuReference& reference) {
  nlohmann::json j;
  j["id"] = reference.eu_document.id;
  j["type"] = reference.eu_document.type;
  put_optional(j, "title", reference.eu_document.title);
  put_optional(j, "short_name", reference.eu_document.short_name);
  put_optional(j, "article", reference.article);
  j["reference_type"] = reference.reference_type;
  j["is_primary_implementation"] = reference.is_primary_implementation;
  j["full_citation"] = reference.full_citation.value_or(reference.eu_document.id);
  put_optional(j, "context", reference.context);
  return j;
}

}  // namespace lexcite::domain
