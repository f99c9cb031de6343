#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <regex>
#include <string>
#include <string_view>
#include <vector>

#include "internal/model/record.hpp"
#include "internal/model/value.hpp"

namespace datalens::query {

class FieldAccessor;

enum class QueryOperator : std::uint8_t {
  kEqual,
  kNotEqual,
  kGreater,
  kGreaterOrEqual,
  kLess,
  kLessOrEqual,
  kContains,
  kNotContains,
  kStartsWith,
  kEndsWith,
  kRegex,
  kIsNull,
  kIsNotNull,
};

enum class LogicalOperator : std::uint8_t {
  kAnd,
  kOr,
};

std::string_view OperatorSymbol(QueryOperator op);

// Accepts symbols ("==", ">=") and keywords ("contains", "startswith",
// "regex", "isnull", ...), case-insensitive.
std::optional<QueryOperator> ParseOperator(std::string_view text);

/*
  One field-operator-value predicate.

  Evaluate() never throws: a disabled condition, a missing field, a kind
  that does not support the operator or any internal failure (malformed
  regex included) all evaluate to false. The regex is compiled when the
  operator or value is set, so a condition is read-only during evaluation
  and one group may be evaluated from several threads at once.
*/
class QueryCondition {
 public:
  // std::regex matches recursively; longer field values are not matched
  // against a pattern and evaluate to false.
  static constexpr size_t kMaxRegexInputLength = 4096;

  QueryCondition() = default;
  QueryCondition(std::string field_name, QueryOperator op, model::Value value = {}, bool enabled = true);

  bool Evaluate(const model::Record& record, const FieldAccessor& accessor) const;

  // e.g. `hp > 50`, `name contains "go"`, `icon is null`
  std::string DisplayText() const;

  const std::string& field_name() const {
    return field_name_;
  }
  void set_field_name(std::string field_name) {
    field_name_ = std::move(field_name);
  }

  QueryOperator op() const {
    return op_;
  }
  void set_op(QueryOperator op);

  const model::Value& value() const {
    return value_;
  }
  void set_value(model::Value value);

  bool enabled() const {
    return enabled_;
  }
  void set_enabled(bool enabled) {
    enabled_ = enabled;
  }

 private:
  bool EvaluateOperator(const model::Value& field_value) const;
  bool MatchesRegex(const std::string& text) const;
  void CompileRegex();

  std::string   field_name_;
  QueryOperator op_ = QueryOperator::kEqual;
  model::Value  value_;
  bool          enabled_ = true;

  // null unless op_ is kRegex with a valid string pattern
  std::shared_ptr<const std::regex> regex_;
};

/*
  Ordered conditions combined with AND / OR.

  An empty group, or one whose conditions are all disabled, matches every
  record. AND stops at the first failing enabled condition, OR at the
  first passing one.
*/
class QueryGroup {
 public:
  QueryGroup() = default;
  explicit QueryGroup(LogicalOperator logical_op) : logical_op_(logical_op) {
  }

  bool Evaluate(const model::Record& record, const FieldAccessor& accessor) const;

  QueryCondition& Add(QueryCondition condition);
  QueryCondition& AddCondition(std::string field_name = "name", QueryOperator op = QueryOperator::kEqual, model::Value value = {});

  // Out-of-range indices are ignored.
  void Remove(size_t index);
  void Clear();

  size_t Count() const {
    return conditions_.size();
  }
  size_t EnabledCount() const;

  const std::vector<QueryCondition>& conditions() const {
    return conditions_;
  }
  std::vector<QueryCondition>& mutable_conditions() {
    return conditions_;
  }

  LogicalOperator logical_op() const {
    return logical_op_;
  }
  void set_logical_op(LogicalOperator op) {
    logical_op_ = op;
  }

 private:
  std::vector<QueryCondition> conditions_;
  LogicalOperator             logical_op_ = LogicalOperator::kAnd;
};

} // namespace datalens::query
