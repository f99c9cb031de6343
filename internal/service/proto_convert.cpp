#include "proto_convert.hpp"

#include <string>
#include <type_traits>
#include <variant>

#include "internal/util/errors.hpp"

namespace datalens::service {

using namespace datalens::v1;

// ------------------------------------------------------------
// Values
// ------------------------------------------------------------

FieldValue ToProto(const model::Value& value) {
  FieldValue out;
  std::visit(
      [&](const auto& v) {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
          out.mutable_null_value();
        } else if constexpr (std::is_same_v<T, std::int64_t>) {
          out.set_int_value(v);
        } else if constexpr (std::is_same_v<T, double>) {
          out.set_float_value(v);
        } else if constexpr (std::is_same_v<T, bool>) {
          out.set_bool_value(v);
        } else if constexpr (std::is_same_v<T, std::string>) {
          out.set_string_value(v);
        } else if constexpr (std::is_same_v<T, model::Vector2>) {
          out.mutable_vector2_value()->set_x(v.x);
          out.mutable_vector2_value()->set_y(v.y);
        } else if constexpr (std::is_same_v<T, model::Vector3>) {
          out.mutable_vector3_value()->set_x(v.x);
          out.mutable_vector3_value()->set_y(v.y);
          out.mutable_vector3_value()->set_z(v.z);
        } else if constexpr (std::is_same_v<T, model::Color>) {
          auto* c = out.mutable_color_value();
          c->set_r(v.r);
          c->set_g(v.g);
          c->set_b(v.b);
          c->set_a(v.a);
        } else if constexpr (std::is_same_v<T, model::EnumValue>) {
          out.mutable_enum_value()->set_name(v.name);
          out.mutable_enum_value()->set_ordinal(v.ordinal);
        } else if constexpr (std::is_same_v<T, model::ObjectRef>) {
          out.mutable_object_value()->set_type_name(v.type_name);
          out.mutable_object_value()->set_label(v.label);
        } else if constexpr (std::is_same_v<T, model::RecordRef>) {
          out.mutable_record_value()->set_value(v.identity);
        }
      },
      value.storage());
  return out;
}

model::Value FromProto(const FieldValue& value) {
  switch (value.kind_case()) {
    case FieldValue::kIntValue:
      return value.int_value();
    case FieldValue::kFloatValue:
      return value.float_value();
    case FieldValue::kBoolValue:
      return value.bool_value();
    case FieldValue::kStringValue:
      return value.string_value();
    case FieldValue::kVector2Value:
      return model::Vector2{value.vector2_value().x(), value.vector2_value().y()};
    case FieldValue::kVector3Value:
      return model::Vector3{value.vector3_value().x(), value.vector3_value().y(), value.vector3_value().z()};
    case FieldValue::kColorValue: {
      const auto& c = value.color_value();
      return model::Color{c.r(), c.g(), c.b(), c.a()};
    }
    case FieldValue::kEnumValue:
      return model::EnumValue{value.enum_value().name(), value.enum_value().ordinal()};
    case FieldValue::kObjectValue:
      return model::ObjectRef{value.object_value().type_name(), value.object_value().label()};
    case FieldValue::kRecordValue:
      return model::RecordRef{value.record_value().value()};
    case FieldValue::kNullValue:
    case FieldValue::KIND_NOT_SET:
      break;
  }
  return model::Value::Null();
}

RecordRef ToRecordRef(const model::Record& record) {
  RecordRef out;
  out.mutable_id()->set_value(record.Identity());
  out.set_name(record.Name());
  out.set_type_name(record.Type().name());
  out.set_category(record.Type().category());
  return out;
}

// ------------------------------------------------------------
// Operators
// ------------------------------------------------------------

query::QueryOperator FromProto(QueryOperator op) {
  switch (op) {
    case QUERY_OPERATOR_EQUAL:
      return query::QueryOperator::kEqual;
    case QUERY_OPERATOR_NOT_EQUAL:
      return query::QueryOperator::kNotEqual;
    case QUERY_OPERATOR_GREATER:
      return query::QueryOperator::kGreater;
    case QUERY_OPERATOR_GREATER_OR_EQUAL:
      return query::QueryOperator::kGreaterOrEqual;
    case QUERY_OPERATOR_LESS:
      return query::QueryOperator::kLess;
    case QUERY_OPERATOR_LESS_OR_EQUAL:
      return query::QueryOperator::kLessOrEqual;
    case QUERY_OPERATOR_CONTAINS:
      return query::QueryOperator::kContains;
    case QUERY_OPERATOR_NOT_CONTAINS:
      return query::QueryOperator::kNotContains;
    case QUERY_OPERATOR_STARTS_WITH:
      return query::QueryOperator::kStartsWith;
    case QUERY_OPERATOR_ENDS_WITH:
      return query::QueryOperator::kEndsWith;
    case QUERY_OPERATOR_REGEX:
      return query::QueryOperator::kRegex;
    case QUERY_OPERATOR_IS_NULL:
      return query::QueryOperator::kIsNull;
    case QUERY_OPERATOR_IS_NOT_NULL:
      return query::QueryOperator::kIsNotNull;
    default:
      break;
  }
  throw util::InvalidArgument("query operator is unspecified or unknown: " + std::to_string(static_cast<int>(op)));
}

QueryOperator ToProto(query::QueryOperator op) {
  switch (op) {
    case query::QueryOperator::kEqual:
      return QUERY_OPERATOR_EQUAL;
    case query::QueryOperator::kNotEqual:
      return QUERY_OPERATOR_NOT_EQUAL;
    case query::QueryOperator::kGreater:
      return QUERY_OPERATOR_GREATER;
    case query::QueryOperator::kGreaterOrEqual:
      return QUERY_OPERATOR_GREATER_OR_EQUAL;
    case query::QueryOperator::kLess:
      return QUERY_OPERATOR_LESS;
    case query::QueryOperator::kLessOrEqual:
      return QUERY_OPERATOR_LESS_OR_EQUAL;
    case query::QueryOperator::kContains:
      return QUERY_OPERATOR_CONTAINS;
    case query::QueryOperator::kNotContains:
      return QUERY_OPERATOR_NOT_CONTAINS;
    case query::QueryOperator::kStartsWith:
      return QUERY_OPERATOR_STARTS_WITH;
    case query::QueryOperator::kEndsWith:
      return QUERY_OPERATOR_ENDS_WITH;
    case query::QueryOperator::kRegex:
      return QUERY_OPERATOR_REGEX;
    case query::QueryOperator::kIsNull:
      return QUERY_OPERATOR_IS_NULL;
    case query::QueryOperator::kIsNotNull:
      return QUERY_OPERATOR_IS_NOT_NULL;
  }
  return QUERY_OPERATOR_UNSPECIFIED;
}

query::LogicalOperator FromProto(LogicalOperator op) {
  return op == LOGICAL_OPERATOR_OR ? query::LogicalOperator::kOr : query::LogicalOperator::kAnd;
}

query::QueryGroup FromProto(const ConditionGroup& group) {
  query::QueryGroup out(FromProto(group.logical_op()));
  for (int i = 0; i < group.conditions_size(); ++i) {
    const auto& c = group.conditions(i);
    if (c.field_name().empty()) {
      throw util::InvalidArgument("condition " + std::to_string(i) + " has an empty field name");
    }
    const bool enabled = !c.has_enabled() || c.enabled();
    out.Add(query::QueryCondition(c.field_name(), FromProto(c.op()), FromProto(c.value()), enabled));
  }
  return out;
}

NodeSummary ToNodeSummary(const graph::Node& node) {
  NodeSummary out;
  if (node.record) {
    *out.mutable_record() = ToRecordRef(*node.record);
  } else {
    out.mutable_record()->mutable_id()->set_value(node.identity);
  }
  out.set_reference_count(node.ReferenceCount());
  out.set_dependency_count(node.DependencyCount());
  out.set_orphan(node.IsOrphan());
  return out;
}

} // namespace datalens::service
