#pragma once

#include <cstddef>
#include <string>

namespace lexcite::text {

/// Deterministic line-level normalization for registry text
namespace hygiene {

/// Normalize line endings to \n (Unix style)
std::string normalize_line_endings(const std::string& text);

/// Trim trailing whitespace from each line
std::string trim_trailing_whitespace(const std::string& text);

/// Collapse runs of blank lines longer than max_blank_lines down to max_blank_lines
std::string collapse_blank_lines(const std::string& text, std::size_t max_blank_lines = 1);

}  // namespace hygiene
}  // namespace lexcite::text
