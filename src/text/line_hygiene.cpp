#include "lexcite/text/line_hygiene.h"

#include "lexcite/core/normalization.h"
#include "lexcite/core/unicode_text.h"

#include <string>
#include <vector>

namespace lexcite::text::hygiene {

std::string normalize_line_endings(const std::string& text) {
  std::string result;
  result.reserve(text.size());

  for (std::size_t i = 0; i < text.size(); ++i) {
    if (text[i] == '\r') {
      // \r\n (Windows) and lone \r (old Mac) both become \n
      if (i + 1 < text.size() && text[i + 1] == '\n') {
        ++i;
      }
      result += '\n';
    } else {
      result += text[i];
    }
  }

  return result;
}

std::string trim_trailing_whitespace(const std::string& text) {
  std::vector<std::string> lines = core::split_lines(text);
  for (auto& line : lines) {
    line = core::trim_end(line);
  }
  return core::join_lines(lines);
}

std::string collapse_blank_lines(const std::string& text, const std::size_t max_blank_lines) {
  std::vector<std::string> kept;
  std::size_t blank_count = 0;

  for (auto& line : core::split_lines(text)) {
    if (core::trim(line).empty()) {
      ++blank_count;
      if (blank_count > max_blank_lines) {
        continue;
      }
    } else {
      blank_count = 0;
    }
    kept.push_back(std::move(line));
  }

  return core::join_lines(kept);
}

}  // namespace lexcite::text::hygiene
