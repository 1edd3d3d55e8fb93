#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace lexcite::core {

// Whitespace-aware helpers over UTF-8 text. Whitespace is the Unicode
// White_Space property plus U+FEFF, so NBSP (U+00A0), the narrow NBSP and
// the ideographic space are stripped like ASCII blanks. Malformed UTF-8
// sequences are never treated as whitespace.

// trim removes leading and trailing whitespace.
[[nodiscard]] std::string trim(std::string_view input);

// trim_end removes trailing whitespace only.
[[nodiscard]] std::string trim_end(std::string_view input);

// split_whitespace splits on runs of whitespace, dropping empty tokens.
[[nodiscard]] std::vector<std::string> split_whitespace(std::string_view input);

}  // namespace lexcite::core
