#pragma once

#include "datalens/v1.hpp"
#include "internal/graph/dependency_graph.hpp"
#include "internal/model/record.hpp"
#include "internal/query/query_condition.hpp"

namespace datalens::service {

/*
  Conversions between the wire messages and the core types.
*/

datalens::v1::FieldValue ToProto(const model::Value& value);
model::Value             FromProto(const datalens::v1::FieldValue& value);

datalens::v1::RecordRef ToRecordRef(const model::Record& record);

// Throws InvalidArgument for QUERY_OPERATOR_UNSPECIFIED and unknown values.
query::QueryOperator         FromProto(datalens::v1::QueryOperator op);
datalens::v1::QueryOperator  ToProto(query::QueryOperator op);
query::LogicalOperator       FromProto(datalens::v1::LogicalOperator op);

// Throws InvalidArgument for an empty field name or an invalid operator.
query::QueryGroup FromProto(const datalens::v1::ConditionGroup& group);

datalens::v1::NodeSummary ToNodeSummary(const graph::Node& node);

} // namespace datalens::service
