#include "dynamic_record.hpp"

#include "internal/util/errors.hpp"

namespace datalens::model {

namespace {

const schema::FieldDefinition* FindDeclared(const schema::RecordType& type, const std::string& field_name) {
  for (const schema::RecordType* t = &type; t; t = t->base()) {
    if (const auto* field = t->FindOwnField(field_name)) return field;
  }
  return nullptr;
}

} // namespace

DynamicRecord::DynamicRecord(std::string identity, std::string name, std::shared_ptr<const schema::RecordType> type)
    : identity_(std::move(identity)), name_(std::move(name)), type_(std::move(type)) {
  if (!type_) {
    throw util::InvalidArgument("record '" + identity_ + "' has no type");
  }
}

Value DynamicRecord::Get(const schema::FieldDescriptor& field) const {
  auto it = values_.find(field.name);
  if (it == values_.end()) {
    return Value::Null();
  }
  return it->second;
}

void DynamicRecord::Set(const std::string& field_name, Value value) {
  const auto* field = FindDeclared(*type_, field_name);
  if (!field) {
    throw util::InvalidArgument("field '" + field_name + "' is not declared on type '" + type_->name() + "'");
  }
  if (field->kind == schema::FieldKind::kDelegate) {
    throw util::InvalidArgument("field '" + field_name + "' is a delegate and holds no value");
  }
  if (!value.IsNull() && value.Kind() != schema::ValueKindOf(field->kind)) {
    throw util::InvalidArgument("field '" + field_name + "' expects " + std::string(schema::ToString(field->kind)) + " but got " +
                                std::string(ToString(value.Kind())));
  }
  values_[field_name] = std::move(value);
}

} // namespace datalens::model
