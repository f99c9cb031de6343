#include "value_comparator.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>
#include <limits>
#include <string>

namespace datalens::query {

using model::Value;
using model::ValueKind;

namespace {

template <typename T>
int ThreeWay(const T& a, const T& b) {
  if (a < b) return -1;
  if (b < a) return 1;
  return 0;
}

// NaN sorts before every number and equals only NaN.
int CompareDouble(double a, double b) {
  const bool a_nan = std::isnan(a);
  const bool b_nan = std::isnan(b);
  if (a_nan || b_nan) return b_nan - a_nan;
  return ThreeWay(a, b);
}

int Sign(int v) {
  return (v > 0) - (v < 0);
}

std::string_view Trim(std::string_view text) {
  while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) text.remove_prefix(1);
  while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) text.remove_suffix(1);
  return text;
}

std::string Lower(std::string_view text) {
  std::string out(text);
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return out;
}

std::optional<std::int64_t> ParseInteger(std::string_view text) {
  text = Trim(text);
  if (!text.empty() && text.front() == '+') text.remove_prefix(1);
  std::int64_t out = 0;
  auto [ptr, ec]   = std::from_chars(text.data(), text.data() + text.size(), out);
  if (ec != std::errc() || ptr != text.data() + text.size() || text.empty()) return std::nullopt;
  return out;
}

std::optional<double> ParseFloat(std::string_view text) {
  text = Trim(text);
  if (!text.empty() && text.front() == '+') text.remove_prefix(1);
  double out     = 0;
  auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), out);
  if (ec != std::errc() || ptr != text.data() + text.size() || text.empty()) return std::nullopt;
  return out;
}

std::optional<bool> ParseBool(std::string_view text) {
  const auto lowered = Lower(Trim(text));
  if (lowered == "true") return true;
  if (lowered == "false") return false;
  return std::nullopt;
}

// Numeric view of integer, float, bool and enum values.
std::optional<double> NumericOf(const Value& value) {
  if (const auto* v = value.As<std::int64_t>()) return static_cast<double>(*v);
  if (const auto* v = value.As<double>()) return *v;
  if (const auto* v = value.As<bool>()) return *v ? 1.0 : 0.0;
  if (const auto* v = value.As<model::EnumValue>()) return static_cast<double>(v->ordinal);
  return std::nullopt;
}

int CompareSameKind(const Value& a, const Value& b) {
  switch (a.Kind()) {
    case ValueKind::kNull:
      return 0;
    case ValueKind::kInteger:
      return ThreeWay(*a.As<std::int64_t>(), *b.As<std::int64_t>());
    case ValueKind::kFloat:
      return CompareDouble(*a.As<double>(), *b.As<double>());
    case ValueKind::kBoolean:
      return ThreeWay(*a.As<bool>(), *b.As<bool>());
    case ValueKind::kString:
      return Sign(a.As<std::string>()->compare(*b.As<std::string>()));
    case ValueKind::kEnum:
      return ThreeWay(a.As<model::EnumValue>()->ordinal, b.As<model::EnumValue>()->ordinal);
    case ValueKind::kRecordRef:
      return Sign(a.As<model::RecordRef>()->identity.compare(b.As<model::RecordRef>()->identity));
    case ValueKind::kVector2:
    case ValueKind::kVector3:
    case ValueKind::kColor:
    case ValueKind::kObject:
      return CompareIgnoreCase(a.ToString(), b.ToString());
  }
  return CompareIgnoreCase(a.ToString(), b.ToString());
}

} // namespace

int CompareIgnoreCase(std::string_view a, std::string_view b) {
  const auto n = std::min(a.size(), b.size());
  for (size_t i = 0; i < n; ++i) {
    const int ca = std::tolower(static_cast<unsigned char>(a[i]));
    const int cb = std::tolower(static_cast<unsigned char>(b[i]));
    if (ca != cb) return ca < cb ? -1 : 1;
  }
  return ThreeWay(a.size(), b.size());
}

std::optional<Value> Coerce(const Value& value, ValueKind target) {
  if (value.IsNull()) return std::nullopt;
  if (value.Kind() == target) return value;

  const auto* text = value.As<std::string>();

  switch (target) {
    case ValueKind::kInteger: {
      if (text) {
        if (auto parsed = ParseInteger(*text)) return Value(*parsed);
        return std::nullopt;
      }
      auto numeric = NumericOf(value);
      if (!numeric || !std::isfinite(*numeric)) return std::nullopt;
      // round half to even, like a checked numeric conversion
      const double rounded = std::nearbyint(*numeric);
      if (rounded < static_cast<double>(std::numeric_limits<std::int64_t>::min()) ||
          rounded >= static_cast<double>(std::numeric_limits<std::int64_t>::max())) {
        return std::nullopt;
      }
      return Value(static_cast<std::int64_t>(rounded));
    }
    case ValueKind::kFloat: {
      if (text) {
        if (auto parsed = ParseFloat(*text)) return Value(*parsed);
        return std::nullopt;
      }
      if (auto numeric = NumericOf(value)) return Value(*numeric);
      return std::nullopt;
    }
    case ValueKind::kBoolean: {
      if (text) {
        if (auto parsed = ParseBool(*text)) return Value(*parsed);
        return std::nullopt;
      }
      if (value.Kind() == ValueKind::kInteger || value.Kind() == ValueKind::kFloat) {
        return Value(*NumericOf(value) != 0.0);
      }
      return std::nullopt;
    }
    case ValueKind::kString:
      return Value(value.ToString());
    case ValueKind::kEnum: {
      if (const auto* ordinal = value.As<std::int64_t>()) return Value(model::EnumValue{"", *ordinal});
      return std::nullopt;
    }
    case ValueKind::kRecordRef: {
      if (text) return Value(model::RecordRef{*text});
      return std::nullopt;
    }
    default:
      return std::nullopt;
  }
}

int Compare(const Value& a, const Value& b) {
  if (a.IsNull() && b.IsNull()) return 0;
  if (a.IsNull()) return -1;
  if (b.IsNull()) return 1;

  if (a.Kind() == b.Kind()) return CompareSameKind(a, b);

  if (auto converted = Coerce(b, a.Kind())) {
    return CompareSameKind(a, *converted);
  }

  return CompareIgnoreCase(a.ToString(), b.ToString());
}

bool MatchesText(const Value& value, const Value& needle, TextMatchMode mode) {
  if (value.IsNull() || needle.IsNull()) return false;

  const auto haystack = Lower(value.ToString());
  const auto pattern  = Lower(needle.ToString());

  switch (mode) {
    case TextMatchMode::kContains:
      return haystack.find(pattern) != std::string::npos;
    case TextMatchMode::kStartsWith:
      return haystack.starts_with(pattern);
    case TextMatchMode::kEndsWith:
      return haystack.ends_with(pattern);
  }
  return false;
}

} // namespace datalens::query
