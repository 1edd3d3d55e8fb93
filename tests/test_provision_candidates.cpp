#include "lexcite/citation/provision_candidates.h"

#include <catch2/catch_test_macros.hpp>

#include <string>
#include <vector>

using namespace lexcite;

TEST_CASE("build_provision_candidates strips section markers", "[citation][candidates]") {
  for (const std::string ref : {"§ 4a", "§4a", "Paragraph 4a", "Paragraf 4a", "para4a", "4a"}) {
    const auto candidates = citation::build_provision_candidates(ref);
    INFO(ref);
    CHECK(candidates.canonical_section == "4a");
    CHECK(candidates.provision_refs == std::vector<std::string>{"para4a"});
    CHECK(candidates.sections == std::vector<std::string>{"§ 4a", "4a"});
  }
}

TEST_CASE("build_provision_candidates offers lowercase letter suffixes",
          "[citation][candidates]") {
  const auto candidates = citation::build_provision_candidates("§ 12A");

  CHECK(candidates.canonical_section == "12A");
  CHECK(candidates.provision_refs == std::vector<std::string>{"para12A", "para12a"});
  CHECK(candidates.sections == std::vector<std::string>{"§ 12A", "12A", "§ 12a", "12a"});
}

TEST_CASE("build_provision_candidates yields nothing for empty references",
          "[citation][candidates]") {
  CHECK(citation::build_provision_candidates("").empty());
  CHECK(citation::build_provision_candidates("  ").empty());
  CHECK(citation::build_provision_candidates("§").empty());
}
