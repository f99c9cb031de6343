#include "query_engine.hpp"

#include "internal/query/field_accessor.hpp"
#include "internal/query/value_comparator.hpp"
#include "internal/util/errors.hpp"

namespace datalens::query {

QueryEngine::QueryEngine(std::shared_ptr<const FieldAccessor> accessor) : accessor_(std::move(accessor)) {
  if (!accessor_) {
    throw util::InvalidArgument("query engine requires a field accessor");
  }
}

model::RecordSet QueryEngine::Query(const QueryGroup& group, const model::RecordSet& source) const {
  model::RecordSet results;
  for (const auto& record : source) {
    if (record && group.Evaluate(*record, *accessor_)) {
      results.push_back(record);
    }
  }
  return results;
}

model::RecordSet QueryEngine::QueryByField(const std::string& field_name, QueryOperator op, model::Value value, const model::RecordSet& source) const {
  QueryGroup group;
  group.AddCondition(field_name, op, std::move(value));
  return Query(group, source);
}

model::RecordSet QueryEngine::SearchByName(std::string_view term, bool case_sensitive, const model::RecordSet& source) const {
  model::RecordSet results;
  const model::Value needle{std::string(term)};

  for (const auto& record : source) {
    if (!record) continue;

    const bool matched = case_sensitive ? record->Name().find(term) != std::string::npos
                                        : MatchesText(model::Value(record->Name()), needle, TextMatchMode::kContains);
    if (matched) results.push_back(record);
  }
  return results;
}

} // namespace datalens::query
