#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace lexcite::core {

// Deterministic, locale-independent string helpers.
// Only ASCII bytes are inspected; multi-byte UTF-8 sequences pass through
// unchanged, so "§", umlauts and "ß" are never split or altered.

// normalize_ascii_lower converts ASCII uppercase (A-Z) to lowercase (a-z).
inline std::string normalize_ascii_lower(const std::string_view input) {
  std::string result;
  result.reserve(input.size());

  for (const char ch : input) {
    if (ch >= 'A' && ch <= 'Z') {
      constexpr char kCaseOffset = 'a' - 'A';
      result.push_back(static_cast<char>(ch + kCaseOffset));
    } else {
      result.push_back(ch);
    }
  }

  return result;
}

// split_lines splits on '\n'. A trailing newline yields a final empty line,
// and an empty input yields a single empty line.
inline std::vector<std::string> split_lines(const std::string_view input) {
  std::vector<std::string> lines;
  std::size_t start = 0;
  while (true) {
    const auto pos = input.find('\n', start);
    if (pos == std::string_view::npos) {
      lines.emplace_back(input.substr(start));
      break;
    }
    lines.emplace_back(input.substr(start, pos - start));
    start = pos + 1;
  }
  return lines;
}

inline std::string join_lines(const std::vector<std::string>& lines) {
  std::string result;
  for (std::size_t i = 0; i < lines.size(); ++i) {
    if (i > 0) {
      result += '\n';
    }
    result += lines[i];
  }
  return result;
}

// contains_ascii_ci reports whether needle occurs in haystack, comparing
// ASCII letters case-insensitively (the same folding SQLite's LIKE applies).
inline bool contains_ascii_ci(const std::string_view haystack, const std::string_view needle) {
  return normalize_ascii_lower(haystack).find(normalize_ascii_lower(needle)) != std::string::npos;
}

// escape_like_pattern escapes SQL LIKE wildcards ('%', '_') and the escape
// character itself with a backslash. Use with ESCAPE '\'.
inline std::string escape_like_pattern(const std::string_view input) {
  std::string result;
  result.reserve(input.size());
  for (const char ch : input) {
    if (ch == '%' || ch == '_' || ch == '\\') {
      result.push_back('\\');
    }
    result.push_back(ch);
  }
  return result;
}

}  // namespace lexcite::core
