#pragma once

#include <compare>
#include <string>

namespace lexcite::core {

// DocumentId is the storage system's stable identifier for a statute
// (e.g. "gesetz-10001622"). Wrapped so it cannot be confused with a title
// or a free-form lookup term.
struct DocumentId {
  std::string value;
  auto operator<=>(const DocumentId&) const = default;
};

}  // namespace lexcite::core
