#pragma once

#include <optional>
#include <string_view>

#include "internal/model/value.hpp"

namespace datalens::query {

enum class TextMatchMode {
  kContains,
  kStartsWith,
  kEndsWith,
};

/*
  Three-way comparison across heterogeneous value kinds.

  - null == null, null sorts before any value
  - same kind: native ordering; vectors, colors and object handles have
    none and compare by case-insensitive text
  - different kinds: b is coerced to a's kind; when that fails both sides
    compare by case-insensitive text. This is intentionally permissive:
    "10" and "9" held as strings order lexically ("10" < "9").

  Returns -1, 0 or 1.
*/
int Compare(const model::Value& a, const model::Value& b);

// Case-insensitive substring / prefix / suffix test on the textual forms.
// A null value or null needle never matches.
bool MatchesText(const model::Value& value, const model::Value& needle, TextMatchMode mode);

// Converts a value to the target kind, or nullopt when no conversion exists.
std::optional<model::Value> Coerce(const model::Value& value, model::ValueKind target);

int CompareIgnoreCase(std::string_view a, std::string_view b);

} // namespace datalens::query
