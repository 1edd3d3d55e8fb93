#pragma once

#include "lexcite/storage/eu_reference_store.h"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace lexcite::app {

// DataSource describes where the registry content comes from.
struct DataSource {
  std::string name;
  std::string authority;
  std::string official_portal;
  std::string api_documentation;
  std::string retrieval_method;
  std::string update_frequency;
  std::string license;
  std::string coverage;
  std::vector<std::string> languages;
};

struct RegistryCounts {
  std::int64_t documents{0};
  std::int64_t provisions{0};
  std::int64_t eu_documents{0};
  std::int64_t eu_references{0};
};

// DatabaseInfo is read from db_metadata, with defaults for absent keys.
struct DatabaseInfo {
  std::string tier{"free"};
  std::string schema_version{"unknown"};
  std::string jurisdiction{"AT"};
  std::optional<std::string> built_at;
  RegistryCounts counts;
};

struct SourcesReport {
  std::vector<DataSource> sources;
  DatabaseInfo database;
};

// list_sources reports provenance and registry build metadata. Never fails;
// a registry without metadata or EU tables reads as defaults and zeros.
[[nodiscard]] SourcesReport list_sources(const storage::IRegistryMetadata& metadata);

struct AboutReport {
  std::string name;
  std::string version;
  std::string dataset_built;  // built_at, or "unknown"
  std::string jurisdiction;
  RegistryCounts counts;
  std::vector<std::string> provenance_sources;
  std::string license;
  std::string access_model;
};

// about describes this tool and the opened dataset.
[[nodiscard]] AboutReport about(const storage::IRegistryMetadata& metadata);

[[nodiscard]] nlohmann::json sources_report_to_json(const SourcesReport& report);
[[nodiscard]] nlohmann::json about_report_to_json(const AboutReport& report);

}  // namespace lexcite::app
