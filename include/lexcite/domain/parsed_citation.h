#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

namespace lexcite::domain {

enum class CitationKind {
  kStatute,
  kStatutoryInstrument,
  kUnknown,
};

// CitationReference is the structured form of a successfully parsed citation.
// section is always non-empty; subsection and paragraph are the contents of
// the parenthesized sub-tokens, e.g. "3(1)(a)" -> "3", "1", "a".
struct CitationReference {
  CitationKind kind{CitationKind::kStatute};
  std::optional<std::string> title;
  std::optional<int> year;
  std::string section;
  std::optional<std::string> subsection;
  std::optional<std::string> paragraph;

  bool operator==(const CitationReference&) const = default;
};

struct CitationFailure {
  std::string error;

  bool operator==(const CitationFailure&) const = default;
};

// ParsedCitation is either a reference or a failure with a human-readable
// error. A failure carries no reference fields and always reports kUnknown.
class ParsedCitation {
 public:
  static ParsedCitation success(CitationReference reference) {
    return ParsedCitation(std::move(reference));
  }
  static ParsedCitation failure(std::string error) {
    return ParsedCitation(CitationFailure{std::move(error)});
  }

  [[nodiscard]] bool valid() const { return std::holds_alternative<CitationReference>(data_); }

  [[nodiscard]] CitationKind kind() const {
    return valid() ? reference().kind : CitationKind::kUnknown;
  }

  // Precondition: valid(). Throws std::bad_variant_access otherwise.
  [[nodiscard]] const CitationReference& reference() const {
    return std::get<CitationReference>(data_);
  }

  // Precondition: !valid(). Throws std::bad_variant_access otherwise.
  [[nodiscard]] const std::string& error() const { return std::get<CitationFailure>(data_).error; }

  bool operator==(const ParsedCitation&) const = default;

 private:
  explicit ParsedCitation(CitationReference reference) : data_(std::move(reference)) {}
  explicit ParsedCitation(CitationFailure failure) : data_(std::move(failure)) {}

  std::variant<CitationReference, CitationFailure> data_;
};

enum class CitationStyle {
  kFull,
  kShort,
  kPinpoint,
};

[[nodiscard]] std::string citation_kind_to_string(CitationKind kind);

// citation_style_from_string maps "full", "short" and "pinpoint"
// (case-insensitive) to a style. Anything else is kFull.
[[nodiscard]] CitationStyle citation_style_from_string(std::string_view style);

}  // namespace lexcite::domain
