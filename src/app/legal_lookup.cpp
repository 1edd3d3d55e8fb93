#include "lexcite/app/legal_lookup.h"

#include "lexcite/citation/provision_candidates.h"
#include "lexcite/core/unicode_pattern.h"
#include "lexcite/core/unicode_text.h"
#include "lexcite/domain/json.h"
#include "lexcite/domain/legal_document.h"
#include "lexcite/text/content_cleaner.h"
#include "lexcite/text/fts_query.h"

#include <algorithm>
#include <chrono>
#include <iostream>

namespace lexcite::app {

namespace {

core::DocumentId resolve_or_raw(const storage::IDocumentStore& store, const std::string& term) {
  if (auto id = store.resolve_id(term)) {
    return *id;
  }
  return core::DocumentId{term};
}

bool is_iso_date(const std::string& text) {
  static const core::UnicodePattern kIsoDate(R"(([0-9]{4})-([0-9]{2})-([0-9]{2}))");
  const auto groups = kIsoDate.match_groups(text);
  if (!groups.has_value()) {
    return false;
  }
  const int year = std::stoi(*(*groups)[1]);
  const auto month = static_cast<unsigned>(std::stoi(*(*groups)[2]));
  const auto day = static_cast<unsigned>(std::stoi(*(*groups)[3]));
  const std::chrono::year_month_day date{std::chrono::year{year}, std::chrono::month{month},
                                         std::chrono::day{day}};
  return date.ok();
}

ProvisionView make_view(const domain::LegalDocument& document, const domain::Provision& provision) {
  ProvisionView view;
  view.document_id = document.id;
  view.document_title = document.title;
  view.document_status = document.status;
  view.provision_ref = provision.provision_ref;
  view.chapter = provision.chapter;
  view.section = provision.section;
  view.title = provision.title;
  view.content = text::clean_provision_content(provision.content);
  return view;
}

bool is_known_status(const std::string& status) {
  return status == domain::kStatusInForce || status == domain::kStatusAmended ||
         status == domain::kStatusRepealed;
}

}  // namespace

core::Result<ProvisionLookup, std::string> get_provision(const storage::IDocumentStore& store,
                                                         const GetProvisionRequest& request) {
  using R = core::Result<ProvisionLookup, std::string>;
  const std::string term = core::trim(request.document_id);
  if (term.empty()) {
    return R::err("document_id is required");
  }

  ProvisionLookup lookup;
  const std::optional<std::string>& reference =
      request.provision_ref.has_value() ? request.provision_ref : request.section;
  lookup.specific = reference.has_value() && !core::trim(*reference).empty();

  const core::DocumentId id = resolve_or_raw(store, term);
  const auto document = store.get_document(id);
  if (!document.has_value()) {
    return R::ok(std::move(lookup));
  }

  if (lookup.specific) {
    const auto candidates = citation::build_provision_candidates(*reference);
    if (const auto provision = store.find_provision(id, candidates)) {
      lookup.provisions.push_back(make_view(*document, *provision));
    }
    return R::ok(std::move(lookup));
  }

  // One extra row tells us whether the cap cut anything off.
  auto provisions = store.list_provisions(id, kMaxProvisionsPerDocument + 1);
  if (provisions.size() > kMaxProvisionsPerDocument) {
    provisions.resize(kMaxProvisionsPerDocument);
    lookup.truncated = true;
    lookup.truncation_hint = "Showing the first " + std::to_string(kMaxProvisionsPerDocument) +
                             " provisions. Request a section or provision_ref for the rest.";
  }
  lookup.provisions.reserve(provisions.size());
  for (const auto& provision : provisions) {
    lookup.provisions.push_back(make_view(*document, provision));
  }
  return R::ok(std::move(lookup));
}

core::Result<std::optional<CurrencyReport>, std::string> check_currency(
    const storage::IDocumentStore& store, const CheckCurrencyRequest& request) {
  using R = core::Result<std::optional<CurrencyReport>, std::string>;
  const std::string term = core::trim(request.document_id);
  if (term.empty()) {
    return R::err("document_id is required");
  }
  std::optional<std::string> as_of_date;
  if (request.as_of_date.has_value() && !core::trim(*request.as_of_date).empty()) {
    as_of_date = core::trim(*request.as_of_date);
    if (!is_iso_date(*as_of_date)) {
      return R::err("as_of_date must be an ISO date (YYYY-MM-DD)");
    }
  }

  const core::DocumentId id = resolve_or_raw(store, term);
  const auto document = store.get_document(id);
  if (!document.has_value()) {
    return R::ok(std::nullopt);
  }

  CurrencyReport report;
  report.document_id = document->id;
  report.title = document->title;
  report.status = document->status;
  report.type = document->type;
  report.issued_date = document->issued_date;
  report.in_force_date = document->in_force_date;
  report.is_current = document->status == domain::kStatusInForce;
  if (document->status == domain::kStatusRepealed) {
    report.warnings.emplace_back("This statute has been repealed");
  }

  if (request.provision_ref.has_value() && !core::trim(*request.provision_ref).empty()) {
    const auto candidates = citation::build_provision_candidates(*request.provision_ref);
    const bool exists = !candidates.empty() && store.provision_exists(id, candidates);
    report.provision_exists = exists;
    if (!exists) {
      report.warnings.push_back("Provision \"" + *request.provision_ref +
                                "\" not found in this document");
    }
  }
  if (as_of_date.has_value()) {
    report.warnings.push_back("Historical versions are not stored; status shown is current, not "
                              "as of " + *as_of_date);
  }
  return R::ok(std::optional<CurrencyReport>(std::move(report)));
}

core::Result<SearchOutcome, std::string> search_legislation(
    const storage::IProvisionSearchIndex& index, const storage::IDocumentStore& store,
    const SearchRequest& request) {
  using R = core::Result<SearchOutcome, std::string>;
  const std::string query = core::trim(request.query);
  if (query.empty()) {
    return R::err("query is required");
  }
  if (request.status.has_value() && !is_known_status(*request.status)) {
    return R::err("Unknown status \"" + *request.status +
                  "\" (expected in_force, amended or repealed)");
  }

  domain::SearchFilter filter;
  filter.limit = std::clamp(request.limit, 1, kMaxSearchLimit);
  filter.status = request.status;
  if (request.document_id.has_value() && !core::trim(*request.document_id).empty()) {
    filter.document_id = resolve_or_raw(store, core::trim(*request.document_id));
  }

  const auto variants = text::build_fts_query_variants(query);

  SearchOutcome outcome;
  outcome.executed_query = variants.primary;
  auto primary = index.search(variants.primary, filter);
  if (primary.has_value() && !primary.value().empty()) {
    outcome.hits = primary.value();
    return R::ok(std::move(outcome));
  }
  if (!variants.fallback.has_value()) {
    if (!primary.has_value()) {
      return R::err("Search query could not be parsed: " + primary.error());
    }
    return R::ok(std::move(outcome));
  }

  if (!primary.has_value()) {
    std::cerr << "[search] primary query rejected, retrying with fallback: " << primary.error()
              << "\n";
  }
  auto fallback = index.search(*variants.fallback, filter);
  if (!fallback.has_value()) {
    return R::err("Search query could not be parsed: " + fallback.error());
  }
  outcome.executed_query = *variants.fallback;
  outcome.used_fallback = true;
  outcome.hits = fallback.value();
  return R::ok(std::move(outcome));
}

nlohmann::json provision_view_to_json(const ProvisionView& view) {
  nlohmann::json j;
  j["document_id"] = view.document_id.value;
  j["document_title"] = view.document_title;
  j["document_status"] = view.document_status;
  j["provision_ref"] = view.provision_ref;
  if (view.chapter.has_value()) {
    j["chapter"] = *view.chapter;
  }
  j["section"] = view.section;
  if (view.title.has_value()) {
    j["title"] = *view.title;
  }
  j["content"] = view.content;
  return j;
}

nlohmann::json provision_lookup_to_json(const ProvisionLookup& lookup) {
  nlohmann::json j;
  if (lookup.specific) {
    j["result"] = lookup.provisions.empty() ? nlohmann::json(nullptr)
                                            : provision_view_to_json(lookup.provisions.front());
    return j;
  }
  nlohmann::json results = nlohmann::json::array();
  for (const auto& view : lookup.provisions) {
    results.push_back(provision_view_to_json(view));
  }
  j["results"] = std::move(results);
  j["count"] = lookup.provisions.size();
  if (lookup.truncated) {
    j["truncated"] = true;
    if (lookup.truncation_hint.has_value()) {
      j["hint"] = *lookup.truncation_hint;
    }
  }
  return j;
}

nlohmann::json currency_report_to_json(const CurrencyReport& report) {
  nlohmann::json j;
  j["document_id"] = report.document_id.value;
  j["title"] = report.title;
  j["status"] = report.status;
  j["type"] = report.type;
  if (report.issued_date.has_value()) {
    j["issued_date"] = *report.issued_date;
  }
  if (report.in_force_date.has_value()) {
    j["in_force_date"] = *report.in_force_date;
  }
  j["is_current"] = report.is_current;
  if (report.provision_exists.has_value()) {
    j["provision_exists"] = *report.provision_exists;
  }
  j["warnings"] = report.warnings;
  return j;
}

nlohmann::json search_outcome_to_json(const SearchOutcome& outcome) {
  nlohmann::json results = nlohmann::json::array();
  for (const auto& hit : outcome.hits) {
    results.push_back(domain::search_hit_to_json(hit));
  }
  nlohmann::json j;
  j["query"] = outcome.executed_query;
  j["used_fallback"] = outcome.used_fallback;
  j["count"] = outcome.hits.size();
  j["results"] = std::move(results);
  return j;
}

}  // namespace lexcite::app
