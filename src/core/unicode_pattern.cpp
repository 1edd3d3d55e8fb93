#include "lexcite/core/unicode_pattern.h"

#include <unicode/regex.h>
#include <unicode/stringpiece.h>
#include <unicode/uchar.h>
#include <unicode/unistr.h>
#include <unicode/utf8.h>

#include <stdexcept>

namespace lexcite::core {

namespace {

icu::UnicodeString to_unicode(const std::string_view text) {
  return icu::UnicodeString::fromUTF8(
      icu::StringPiece(text.data(), static_cast<int32_t>(text.size())));
}

std::string to_utf8(const icu::UnicodeString& text) {
  std::string out;
  text.toUTF8String(out);
  return out;
}

}  // namespace

struct UnicodePattern::Impl {
  std::unique_ptr<icu::RegexPattern> pattern;
};

UnicodePattern::UnicodePattern(const std::string_view pattern, const bool case_insensitive)
    : impl_(std::make_unique<Impl>()) {
  UErrorCode status = U_ZERO_ERROR;
  UParseError parse_error{};
  const uint32_t flags = case_insensitive ? UREGEX_CASE_INSENSITIVE : 0;
  impl_->pattern.reset(
      icu::RegexPattern::compile(to_unicode(pattern), flags, parse_error, status));
  if (U_FAILURE(status) || !impl_->pattern) {
    throw std::invalid_argument("Invalid pattern \"" + std::string(pattern) +
                                "\": " + u_errorName(status) + " at offset " +
                                std::to_string(parse_error.offset));
  }
}

UnicodePattern::~UnicodePattern() = default;
UnicodePattern::UnicodePattern(UnicodePattern&&) noexcept = default;
UnicodePattern& UnicodePattern::operator=(UnicodePattern&&) noexcept = default;

bool UnicodePattern::matches(const std::string_view text) const {
  const icu::UnicodeString input = to_unicode(text);
  UErrorCode status = U_ZERO_ERROR;
  std::unique_ptr<icu::RegexMatcher> matcher(impl_->pattern->matcher(input, status));
  if (U_FAILURE(status)) {
    return false;
  }
  const bool matched = matcher->matches(status);
  return U_SUCCESS(status) && matched;
}

bool UnicodePattern::search(const std::string_view text) const {
  const icu::UnicodeString input = to_unicode(text);
  UErrorCode status = U_ZERO_ERROR;
  std::unique_ptr<icu::RegexMatcher> matcher(impl_->pattern->matcher(input, status));
  if (U_FAILURE(status)) {
    return false;
  }
  const bool found = matcher->find(0, status);
  return U_SUCCESS(status) && found;
}

std::optional<UnicodePattern::Groups> UnicodePattern::match_groups(
    const std::string_view text) const {
  const icu::UnicodeString input = to_unicode(text);
  UErrorCode status = U_ZERO_ERROR;
  std::unique_ptr<icu::RegexMatcher> matcher(impl_->pattern->matcher(input, status));
  if (U_FAILURE(status)) {
    return std::nullopt;
  }
  if (!matcher->matches(status) || U_FAILURE(status)) {
    return std::nullopt;
  }

  Groups groups;
  const int32_t count = matcher->groupCount();
  groups.reserve(static_cast<std::size_t>(count) + 1);
  for (int32_t i = 0; i <= count; ++i) {
    // start() is -1 for a group that did not take part in the match.
    if (matcher->start(i, status) < 0 || U_FAILURE(status)) {
      groups.emplace_back(std::nullopt);
      status = U_ZERO_ERROR;
      continue;
    }
    groups.emplace_back(to_utf8(matcher->group(i, status)));
  }
  return groups;
}

std::string UnicodePattern::replace_all(const std::string_view text,
                                        const std::string_view replacement) const {
  const icu::UnicodeString input = to_unicode(text);
  UErrorCode status = U_ZERO_ERROR;
  std::unique_ptr<icu::RegexMatcher> matcher(impl_->pattern->matcher(input, status));
  if (U_FAILURE(status)) {
    return std::string{text};
  }
  // Literal replacement: '$' and '\' would otherwise be group references.
  const icu::UnicodeString literal = to_unicode(replacement);
  icu::UnicodeString quoted;
  for (int32_t i = 0; i < literal.length(); ++i) {
    const char16_t ch = literal.charAt(i);
    if (ch == u'$' || ch == u'\\') {
      quoted.append(u'\\');
    }
    quoted.append(ch);
  }
  const icu::UnicodeString result = matcher->replaceAll(quoted, status);
  if (U_FAILURE(status)) {
    return std::string{text};
  }
  return to_utf8(result);
}

std::string keep_word_characters(const std::string_view token) {
  std::string out;
  out.reserve(token.size());

  const auto* bytes = reinterpret_cast<const uint8_t*>(token.data());
  const auto length = static_cast<int32_t>(token.size());
  int32_t offset = 0;
  while (offset < length) {
    const int32_t start = offset;
    UChar32 cp = 0;
    U8_NEXT(bytes, offset, length, cp);
    if (cp < 0) {
      continue;
    }
    const bool keep = cp == '_' || cp == '-' ||
                      (U_GET_GC_MASK(cp) & (U_GC_L_MASK | U_GC_N_MASK)) != 0;
    if (keep) {
      out.append(token.substr(static_cast<std::size_t>(start),
                              static_cast<std::size_t>(offset - start)));
    }
  }
  return out;
}

}  // namespace lexcite::core
