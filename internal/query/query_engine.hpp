#pragma once

#include <memory>
#include <string>
#include <string_view>

#include "internal/model/record.hpp"
#include "internal/query/query_condition.hpp"

namespace datalens::query {

class FieldAccessor;

/*
  Stable predicate filter over a record set.

  Output preserves the input order; null entries are skipped. Cost is
  O(records x enabled conditions). The engine reads records directly and is
  independent of the dependency graph.
*/
class QueryEngine {
 public:
  // Throws InvalidArgument when accessor is null.
  explicit QueryEngine(std::shared_ptr<const FieldAccessor> accessor);

  model::RecordSet Query(const QueryGroup& group, const model::RecordSet& source) const;

  model::RecordSet QueryByField(const std::string& field_name, QueryOperator op, model::Value value, const model::RecordSet& source) const;

  // Substring match on the record display name.
  model::RecordSet SearchByName(std::string_view term, bool case_sensitive, const model::RecordSet& source) const;

  const FieldAccessor& accessor() const {
    return *accessor_;
  }

 private:
  std::shared_ptr<const FieldAccessor> accessor_;
};

} // namespace datalens::query
