#pragma once

#include "lexcite/core/ids.h"

#include <optional>
#include <string>

namespace lexcite::domain {

// Document status values as stored by the registry.
constexpr const char* kStatusInForce = "in_force";
constexpr const char* kStatusAmended = "amended";
constexpr const char* kStatusRepealed = "repealed";

// LegalDocument is one statute or regulation.
struct LegalDocument {
  core::DocumentId id;
  std::string title;
  std::optional<std::string> short_name;  // e.g. "ABGB", "DSG"
  std::string status{kStatusInForce};
  std::string type{"statute"};
  std::optional<std::string> issued_date;
  std::optional<std::string> in_force_date;
};

// Provision is the smallest addressable unit of a statute. It is keyed both
// by provision_ref ("para4a") and by section ("4a" or "§ 4a").
// content is the raw registry text, including embedded metadata lines.
struct Provision {
  core::DocumentId document_id;
  std::string provision_ref;
  std::optional<std::string> chapter;
  std::string section;
  std::optional<std::string> title;
  std::string content;
  int order_index{0};
};

}  // namespace lexcite::domain
