#include "lexcite/core/unicode_text.h"

#include <unicode/uchar.h>
#include <unicode/utf8.h>

#include <cstdint>

namespace lexcite::core {

namespace {

bool is_whitespace(const UChar32 cp) {
  return cp >= 0 && (u_isUWhiteSpace(cp) || cp == 0xFEFF);
}

const uint8_t* as_bytes(const std::string_view text) {
  return reinterpret_cast<const uint8_t*>(text.data());
}

int32_t trimmed_start(const std::string_view input) {
  const auto* bytes = as_bytes(input);
  const auto length = static_cast<int32_t>(input.size());
  int32_t start = 0;
  while (start < length) {
    int32_t next = start;
    UChar32 cp = 0;
    U8_NEXT(bytes, next, length, cp);
    if (!is_whitespace(cp)) {
      break;
    }
    start = next;
  }
  return start;
}

int32_t trimmed_end(const std::string_view input, const int32_t start) {
  const auto* bytes = as_bytes(input);
  int32_t end = static_cast<int32_t>(input.size());
  while (end > start) {
    int32_t previous = end;
    UChar32 cp = 0;
    U8_PREV(bytes, start, previous, cp);
    if (!is_whitespace(cp)) {
      break;
    }
    end = previous;
  }
  return end;
}

}  // namespace

std::string trim(const std::string_view input) {
  const int32_t start = trimmed_start(input);
  const int32_t end = trimmed_end(input, start);
  return std::string{input.substr(static_cast<std::size_t>(start),
                                  static_cast<std::size_t>(end - start))};
}

std::string trim_end(const std::string_view input) {
  return std::string{input.substr(0, static_cast<std::size_t>(trimmed_end(input, 0)))};
}

std::vector<std::string> split_whitespace(const std::string_view input) {
  std::vector<std::string> tokens;
  const auto* bytes = as_bytes(input);
  const auto length = static_cast<int32_t>(input.size());

  int32_t offset = 0;
  int32_t token_start = -1;
  while (offset < length) {
    const int32_t start = offset;
    UChar32 cp = 0;
    U8_NEXT(bytes, offset, length, cp);
    if (is_whitespace(cp)) {
      if (token_start >= 0) {
        tokens.emplace_back(input.substr(static_cast<std::size_t>(token_start),
                                         static_cast<std::size_t>(start - token_start)));
        token_start = -1;
      }
    } else if (token_start < 0) {
      token_start = start;
    }
  }
  if (token_start >= 0) {
    tokens.emplace_back(input.substr(static_cast<std::size_t>(token_start)));
  }
  return tokens;
}

}  // namespace lexcite::core
