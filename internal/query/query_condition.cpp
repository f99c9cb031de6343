#include "query_condition.hpp"

#include <algorithm>
#include <cctype>

#include "internal/observability/logging.hpp"
#include "internal/query/field_accessor.hpp"
#include "internal/query/value_comparator.hpp"

namespace datalens::query {

namespace {

struct OperatorName {
  QueryOperator    op;
  std::string_view text;
};

constexpr OperatorName kSymbols[] = {
    {QueryOperator::kEqual, "=="},
    {QueryOperator::kNotEqual, "!="},
    {QueryOperator::kGreater, ">"},
    {QueryOperator::kGreaterOrEqual, ">="},
    {QueryOperator::kLess, "<"},
    {QueryOperator::kLessOrEqual, "<="},
    {QueryOperator::kContains, "contains"},
    {QueryOperator::kNotContains, "not contains"},
    {QueryOperator::kStartsWith, "starts with"},
    {QueryOperator::kEndsWith, "ends with"},
    {QueryOperator::kRegex, "matches"},
    {QueryOperator::kIsNull, "is null"},
    {QueryOperator::kIsNotNull, "is not null"},
};

constexpr OperatorName kAliases[] = {
    {QueryOperator::kEqual, "="},
    {QueryOperator::kEqual, "eq"},
    {QueryOperator::kNotEqual, "<>"},
    {QueryOperator::kNotEqual, "ne"},
    {QueryOperator::kGreater, "gt"},
    {QueryOperator::kGreaterOrEqual, "ge"},
    {QueryOperator::kLess, "lt"},
    {QueryOperator::kLessOrEqual, "le"},
    {QueryOperator::kNotContains, "!contains"},
    {QueryOperator::kNotContains, "not_contains"},
    {QueryOperator::kNotContains, "notcontains"},
    {QueryOperator::kStartsWith, "startswith"},
    {QueryOperator::kStartsWith, "starts_with"},
    {QueryOperator::kStartsWith, "prefix"},
    {QueryOperator::kEndsWith, "endswith"},
    {QueryOperator::kEndsWith, "ends_with"},
    {QueryOperator::kEndsWith, "suffix"},
    {QueryOperator::kRegex, "regex"},
    {QueryOperator::kRegex, "=~"},
    {QueryOperator::kIsNull, "isnull"},
    {QueryOperator::kIsNull, "is_null"},
    {QueryOperator::kIsNotNull, "isnotnull"},
    {QueryOperator::kIsNotNull, "is_not_null"},
    {QueryOperator::kIsNotNull, "notnull"},
};

std::string Lower(std::string_view text) {
  std::string out(text);
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return out;
}

} // namespace

std::string_view OperatorSymbol(QueryOperator op) {
  for (const auto& entry : kSymbols) {
    if (entry.op == op) return entry.text;
  }
  return "?";
}

std::optional<QueryOperator> ParseOperator(std::string_view text) {
  const auto lowered = Lower(text);
  for (const auto& entry : kSymbols) {
    if (entry.text == lowered) return entry.op;
  }
  for (const auto& entry : kAliases) {
    if (entry.text == lowered) return entry.op;
  }
  return std::nullopt;
}

// ------------------------------------------------------------
// QueryCondition
// ------------------------------------------------------------

QueryCondition::QueryCondition(std::string field_name, QueryOperator op, model::Value value, bool enabled)
    : field_name_(std::move(field_name)), op_(op), value_(std::move(value)), enabled_(enabled) {
  CompileRegex();
}

void QueryCondition::set_op(QueryOperator op) {
  op_ = op;
  CompileRegex();
}

void QueryCondition::set_value(model::Value value) {
  value_ = std::move(value);
  CompileRegex();
}

void QueryCondition::CompileRegex() {
  regex_.reset();
  const auto* pattern = value_.As<std::string>();
  if (op_ != QueryOperator::kRegex || !pattern) return;

  try {
    regex_ = std::make_shared<const std::regex>(*pattern, std::regex::ECMAScript);
  } catch (const std::regex_error& e) {
    DATALENS_LOG_DEBUG("invalid regex", {observability::StringField("pattern", *pattern), observability::StringField("error", e.what())});
  }
}

bool QueryCondition::Evaluate(const model::Record& record, const FieldAccessor& accessor) const {
  if (!enabled_) return false;

  try {
    const auto descriptor = accessor.Resolve(record.Type(), field_name_);
    if (!descriptor) return false;

    return EvaluateOperator(accessor.GetValue(record, *descriptor));
  } catch (const std::exception& e) {
    DATALENS_LOG_DEBUG("condition evaluation failed", {observability::StringField("condition", DisplayText()),
                                                       observability::StringField("record", record.Identity()),
                                                       observability::StringField("error", e.what())});
    return false;
  }
}

bool QueryCondition::EvaluateOperator(const model::Value& field_value) const {
  switch (op_) {
    case QueryOperator::kIsNull:
      return field_value.IsNull();
    case QueryOperator::kIsNotNull:
      return !field_value.IsNull();
    case QueryOperator::kEqual:
      return Compare(field_value, value_) == 0;
    case QueryOperator::kNotEqual:
      return Compare(field_value, value_) != 0;
    case QueryOperator::kGreater:
      return Compare(field_value, value_) > 0;
    case QueryOperator::kGreaterOrEqual:
      return Compare(field_value, value_) >= 0;
    case QueryOperator::kLess:
      return Compare(field_value, value_) < 0;
    case QueryOperator::kLessOrEqual:
      return Compare(field_value, value_) <= 0;
    case QueryOperator::kContains:
      return MatchesText(field_value, value_, TextMatchMode::kContains);
    case QueryOperator::kNotContains:
      return !field_value.IsNull() && !value_.IsNull() && !MatchesText(field_value, value_, TextMatchMode::kContains);
    case QueryOperator::kStartsWith:
      return MatchesText(field_value, value_, TextMatchMode::kStartsWith);
    case QueryOperator::kEndsWith:
      return MatchesText(field_value, value_, TextMatchMode::kEndsWith);
    case QueryOperator::kRegex: {
      const auto* text = field_value.As<std::string>();
      if (!text) return false;
      return MatchesRegex(*text);
    }
  }
  return false;
}

bool QueryCondition::MatchesRegex(const std::string& text) const {
  if (!regex_) return false;
  if (text.size() > kMaxRegexInputLength) {
    DATALENS_LOG_DEBUG("regex input too long", {observability::StringField("condition", DisplayText()), observability::SizeField("length", text.size())});
    return false;
  }
  return std::regex_search(text, *regex_);
}

std::string QueryCondition::DisplayText() const {
  std::string text = field_name_ + " " + std::string(OperatorSymbol(op_));
  if (op_ == QueryOperator::kIsNull || op_ == QueryOperator::kIsNotNull) {
    return text;
  }

  if (value_.IsNull()) {
    return text + " null";
  }
  if (value_.IsString()) {
    return text + " \"" + *value_.As<std::string>() + "\"";
  }
  return text + " " + value_.ToString();
}

// ------------------------------------------------------------
// QueryGroup
// ------------------------------------------------------------

bool QueryGroup::Evaluate(const model::Record& record, const FieldAccessor& accessor) const {
  bool any_enabled = false;

  for (const auto& condition : conditions_) {
    if (!condition.enabled()) continue;
    any_enabled = true;

    const bool passed = condition.Evaluate(record, accessor);
    if (logical_op_ == LogicalOperator::kAnd && !passed) return false;
    if (logical_op_ == LogicalOperator::kOr && passed) return true;
  }

  // zero enabled conditions: pass-through
  if (!any_enabled) return true;

  return logical_op_ == LogicalOperator::kAnd;
}

QueryCondition& QueryGroup::Add(QueryCondition condition) {
  conditions_.push_back(std::move(condition));
  return conditions_.back();
}

QueryCondition& QueryGroup::AddCondition(std::string field_name, QueryOperator op, model::Value value) {
  return Add(QueryCondition(std::move(field_name), op, std::move(value)));
}

void QueryGroup::Remove(size_t index) {
  if (index >= conditions_.size()) return;
  conditions_.erase(conditions_.begin() + static_cast<std::ptrdiff_t>(index));
}

void QueryGroup::Clear() {
  conditions_.clear();
}

size_t QueryGroup::EnabledCount() const {
  return static_cast<size_t>(std::count_if(conditions_.begin(), conditions_.end(), [](const QueryCondition& c) { return c.enabled(); }));
}

} // namespace datalens::query
