#pragma once

#include "lexcite/core/ids.h"
#include "lexcite/core/result.h"
#include "lexcite/domain/search.h"
#include "lexcite/storage/document_store.h"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace lexcite::app {

// Provisions returned when a whole document is requested.
constexpr std::size_t kMaxProvisionsPerDocument = 200;

constexpr int kDefaultSearchLimit = 10;
constexpr int kMaxSearchLimit = 50;

// ────────────────────────────────────────────────────────────────
// get_provision
// ────────────────────────────────────────────────────────────────

struct GetProvisionRequest {
  std::string document_id;  // canonical ID, title or short name
  std::optional<std::string> section;
  std::optional<std::string> provision_ref;  // preferred over section when both are set
};

// ProvisionView is a provision joined with its document, content cleaned.
struct ProvisionView {
  core::DocumentId document_id;
  std::string document_title;
  std::string document_status;
  std::string provision_ref;
  std::optional<std::string> chapter;
  std::string section;
  std::optional<std::string> title;
  std::string content;
};

struct ProvisionLookup {
  bool specific{false};  // a section or provision_ref was requested
  std::vector<ProvisionView> provisions;
  bool truncated{false};
  std::optional<std::string> truncation_hint;
};

// get_provision returns one provision (specific == true; zero or one
// entries) or every provision of the document capped at
// kMaxProvisionsPerDocument. An unknown document yields no provisions.
// Error only when document_id is empty.
[[nodiscard]] core::Result<ProvisionLookup, std::string> get_provision(
    const storage::IDocumentStore& store, const GetProvisionRequest& request);

// ────────────────────────────────────────────────────────────────
// check_currency
// ────────────────────────────────────────────────────────────────

struct CheckCurrencyRequest {
  std::string document_id;
  std::optional<std::string> provision_ref;
  std::optional<std::string> as_of_date;  // YYYY-MM-DD, validated only
};

struct CurrencyReport {
  core::DocumentId document_id;
  std::string title;
  std::string status;
  std::string type;
  std::optional<std::string> issued_date;
  std::optional<std::string> in_force_date;
  bool is_current{false};
  std::optional<bool> provision_exists;  // set only when provision_ref was given
  std::vector<std::string> warnings;
};

// check_currency reports whether a statute is in force. nullopt when the
// document cannot be resolved. Errors: empty document_id, an as_of_date that
// is not a calendar date. Only the current version is stored, so a given
// as_of_date adds a warning instead of selecting a historical version.
[[nodiscard]] core::Result<std::optional<CurrencyReport>, std::string> check_currency(
    const storage::IDocumentStore& store, const CheckCurrencyRequest& request);

// ────────────────────────────────────────────────────────────────
// search_legislation
// ────────────────────────────────────────────────────────────────

struct SearchRequest {
  std::string query;
  std::optional<std::string> document_id;
  std::optional<std::string> status;  // in_force | amended | repealed
  int limit{kDefaultSearchLimit};     // clamped to [1, kMaxSearchLimit]
};

struct SearchOutcome {
  std::vector<domain::SearchHit> hits;
  std::string executed_query;
  bool used_fallback{false};
};

// search_legislation runs the primary FTS expression for the query and
// retries with the fallback when the primary is rejected or finds nothing.
[[nodiscard]] core::Result<SearchOutcome, std::string> search_legislation(
    const storage::IProvisionSearchIndex& index, const storage::IDocumentStore& store,
    const SearchRequest& request);

[[nodiscard]] nlohmann::json provision_view_to_json(const ProvisionView& view);
[[nodiscard]] nlohmann::json provision_lookup_to_json(const ProvisionLookup& lookup);
[[nodiscard]] nlohmann::json currency_report_to_json(const CurrencyReport& report);
[[nodiscard]] nlohmann::json search_outcome_to_json(const SearchOutcome& outcome);

}  // namespace lexcite::app
