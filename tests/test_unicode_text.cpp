#include "lexcite/core/unicode_text.h"

#include <catch2/catch_test_macros.hpp>

#include <string>
#include <vector>

using namespace lexcite;

TEST_CASE("trim strips ASCII and Unicode whitespace", "[core][unicode]") {
  CHECK(core::trim("  ABGB\t\n") == "ABGB");
  CHECK(core::trim("\u00A0ABGB\u00A0") == "ABGB");
  CHECK(core::trim("\u3000 § 1 ") == "§ 1");
  CHECK(core::trim("\uFEFFDSG") == "DSG");
  CHECK(core::trim("\u00A0 \u00A0").empty());
  CHECK(core::trim("").empty());
}

TEST_CASE("trim keeps inner whitespace and non-space multibyte characters", "[core][unicode]") {
  CHECK(core::trim(" Bürgerliches\u00A0Gesetzbuch ") == "Bürgerliches\u00A0Gesetzbuch");
  CHECK(core::trim("§") == "§");
  CHECK(core::trim("Größe ß") == "Größe ß");
}

TEST_CASE("trim leaves malformed UTF-8 in place", "[core][unicode]") {
  const std::string malformed = std::string(" \xC3") + "x\xA0 ";
  CHECK(core::trim(malformed) == std::string("\xC3") + "x\xA0");
}

TEST_CASE("trim_end only strips the tail", "[core][unicode]") {
  CHECK(core::trim_end("  (1) Absatz\u00A0 \t") == "  (1) Absatz");
  CHECK(core::trim_end("\u00A0") == "");
}

TEST_CASE("split_whitespace treats NBSP as a separator", "[core][unicode]") {
  CHECK(core::split_whitespace("Daten\u00A0Schutz  Behörde\t") ==
        std::vector<std::string>{"Daten", "Schutz", "Behörde"});
  CHECK(core::split_whitespace(" \u00A0 ").empty());
}
