#include "lexcite/citation/citation_parser.h"

#include "lexcite/core/unicode_pattern.h"
#include "lexcite/core/unicode_text.h"

#include <charconv>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace lexcite::citation {

namespace {

using Groups = core::UnicodePattern::Groups;

// "3", "4a", "3(1)", "3(1)(a)"
constexpr std::string_view kSectionToken = R"(([0-9]+[a-z]?(?:\([0-9]+\))*(?:\([a-z]\))?))";
constexpr std::string_view kSectionMarker = R"((?:§|Paragraph|Paragraf))";

struct TitleAndYear {
  std::optional<std::string> title;
  std::optional<int> year;
};

std::optional<int> parse_year(const std::string& digits) {
  int year = 0;
  const auto* end = digits.data() + digits.size();
  const auto [ptr, ec] = std::from_chars(digits.data(), end, year);
  if (ec != std::errc{} || ptr != end) {
    return std::nullopt;
  }
  return year;
}

std::optional<std::string> non_empty(std::string value) {
  if (value.empty()) {
    return std::nullopt;
  }
  return value;
}

// "Data Protection Act 2018" -> {"Data Protection Act", 2018}
TitleAndYear split_year(const std::string& raw_title) {
  static const core::UnicodePattern kTrailingYear(R"((.*?)\s+([0-9]{4}))");

  const std::string trimmed = core::trim(raw_title);
  const auto groups = kTrailingYear.match_groups(trimmed);
  if (!groups || !(*groups)[1] || !(*groups)[2]) {
    return {non_empty(trimmed), std::nullopt};
  }
  return {non_empty(core::trim(*(*groups)[1])), parse_year(*(*groups)[2])};
}

domain::ParsedCitation make_citation(const std::string& section_token,
                                     const std::optional<std::string>& title,
                                     const std::optional<int> year) {
  static const core::UnicodePattern kMachinePrefix(R"(^para)", true);
  static const core::UnicodePattern kSectionRef(
      R"(([0-9]+[a-z]?)(?:\(([0-9]+)\))?(?:\(([a-z])\))?)", true);

  const std::string normalized = core::trim(kMachinePrefix.replace_all(section_token, ""));

  domain::CitationReference reference;
  reference.kind = domain::CitationKind::kStatute;
  reference.year = year;
  if (title) {
    reference.title = non_empty(core::trim(*title));
  }

  const auto parts = kSectionRef.match_groups(normalized);
  if (parts && (*parts)[1]) {
    reference.section = *(*parts)[1];
    reference.subsection = (*parts)[2];
    reference.paragraph = (*parts)[3];
  } else {
    // Repeated subsections such as "3(1)(2)" are kept verbatim.
    reference.section = normalized;
  }
  return domain::ParsedCitation::success(std::move(reference));
}

domain::ParsedCitation build_section_then_title(const Groups& g) {
  const auto split = split_year(*g[2]);
  return make_citation(*g[1], split.title, split.year);
}

domain::ParsedCitation build_title_then_section(const Groups& g) {
  const auto split = split_year(*g[1]);
  return make_citation(*g[2], split.title, split.year);
}

domain::ParsedCitation build_legacy_english(const Groups& g) {
  const std::optional<int> year = g[3] ? parse_year(*g[3]) : std::nullopt;
  return make_citation(*g[1], g[2], year);
}

domain::ParsedCitation build_bare_section(const Groups& g) {
  return make_citation(*g[1], std::nullopt, std::nullopt);
}

// GrammarForm pairs a whole-input pattern with the constructor applied to
// its capture groups.
struct GrammarForm {
  const char* name;
  core::UnicodePattern pattern;
  domain::ParsedCitation (*build)(const Groups&);
};

const std::vector<GrammarForm>& grammar_forms() {
  static const std::vector<GrammarForm> forms = [] {
    const std::string marker{kSectionMarker};
    const std::string section{kSectionToken};

    std::vector<GrammarForm> f;
    f.push_back(GrammarForm{
        "section_then_title",
        core::UnicodePattern(marker + R"(\s*)" + section + R"(\s*,?\s+(.+))", true),
        &build_section_then_title});
    f.push_back(GrammarForm{
        "title_then_section",
        core::UnicodePattern(R"((.+?)\s+)" + marker + R"(\s*)" + section, true),
        &build_title_then_section});
    f.push_back(GrammarForm{"machine_then_title",
                            core::UnicodePattern(R"(para([0-9]+[a-z]?)\s*,?\s+(.+))", true),
                            &build_section_then_title});
    f.push_back(GrammarForm{
        "legacy_english",
        core::UnicodePattern(R"((?:Section|s\.?)\s+)" + section +
                                 R"(\s*,?\s+(.+?)(?:\s+([0-9]{4}))?)",
                             true),
        &build_legacy_english});
    f.push_back(GrammarForm{"bare_machine", core::UnicodePattern(R"((para[0-9]+[a-z]?))", true),
                            &build_bare_section});
    f.push_back(GrammarForm{"bare_section",
                            core::UnicodePattern(marker + R"(\s*)" + section, true),
                            &build_bare_section});
    return f;
  }();
  return forms;
}

}  // namespace

domain::ParsedCitation parse_citation(const std::string_view raw) {
  const std::string trimmed = core::trim(raw);
  if (trimmed.empty()) {
    return domain::ParsedCitation::failure("Empty citation");
  }

  for (const auto& form : grammar_forms()) {
    if (auto groups = form.pattern.match_groups(trimmed)) {
      return form.build(*groups);
    }
  }

  return domain::ParsedCitation::failure("Could not parse citation: \"" + trimmed + "\"");
}

}  // namespace lexcite::citation
