#pragma once

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace lexcite::core {

// UnicodePattern is a compiled ICU regular expression applied to UTF-8 text.
// Character classes, \s, \w and \b are Unicode-aware, so "§", "Ä" or "ß" are
// ordinary characters rather than byte sequences.
//
// A compiled pattern is immutable and may be shared between threads; every
// operation creates its own matcher.
class UnicodePattern {
 public:
  // Capture groups of a successful match, index 0 is the whole match.
  // Groups that did not participate are nullopt.
  using Groups = std::vector<std::optional<std::string>>;

  // Throws std::invalid_argument when the pattern does not compile.
  explicit UnicodePattern(std::string_view pattern, bool case_insensitive = false);
  ~UnicodePattern();

  UnicodePattern(const UnicodePattern&) = delete;
  UnicodePattern& operator=(const UnicodePattern&) = delete;
  UnicodePattern(UnicodePattern&&) noexcept;
  UnicodePattern& operator=(UnicodePattern&&) noexcept;

  // True when the pattern matches the entire input.
  [[nodiscard]] bool matches(std::string_view text) const;

  // True when the pattern matches anywhere in the input.
  [[nodiscard]] bool search(std::string_view text) const;

  // Whole-input match returning the capture groups, nullopt on no match.
  [[nodiscard]] std::optional<Groups> match_groups(std::string_view text) const;

  // Replaces every match with a literal replacement string.
  [[nodiscard]] std::string replace_all(std::string_view text,
                                        std::string_view replacement) const;

 private:
  struct Impl;

  std::unique_ptr<Impl> impl_;
};

// keep_word_characters returns token with every code point removed except
// Unicode letters (L*), numbers (N*), '_' and '-'. Malformed UTF-8 sequences
// are dropped.
[[nodiscard]] std::string keep_word_characters(std::string_view token);

}  // namespace lexcite::core
