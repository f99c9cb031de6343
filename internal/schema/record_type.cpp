#include "record_type.hpp"

#include <algorithm>
#include <cctype>

#include "internal/util/errors.hpp"

namespace datalens::schema {

namespace {

struct KindName {
  FieldKind        kind;
  std::string_view name;
};

constexpr KindName kKindNames[] = {
    {FieldKind::kInteger, "int"},       {FieldKind::kFloat, "float"},     {FieldKind::kBoolean, "bool"},   {FieldKind::kString, "string"},
    {FieldKind::kVector2, "vector2"},   {FieldKind::kVector3, "vector3"}, {FieldKind::kColor, "color"},    {FieldKind::kEnum, "enum"},
    {FieldKind::kObject, "object"},     {FieldKind::kRecordRef, "record"}, {FieldKind::kDelegate, "delegate"},
};

std::string Lower(std::string_view text) {
  std::string out(text);
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return out;
}

} // namespace

std::string_view ToString(FieldKind kind) {
  for (const auto& entry : kKindNames) {
    if (entry.kind == kind) return entry.name;
  }
  return "unknown";
}

std::optional<FieldKind> ParseFieldKind(std::string_view text) {
  const auto lowered = Lower(text);
  for (const auto& entry : kKindNames) {
    if (entry.name == lowered) return entry.kind;
  }
  // common aliases
  if (lowered == "integer") return FieldKind::kInteger;
  if (lowered == "double") return FieldKind::kFloat;
  if (lowered == "boolean") return FieldKind::kBoolean;
  if (lowered == "event") return FieldKind::kDelegate;
  return std::nullopt;
}

model::ValueKind ValueKindOf(FieldKind kind) {
  switch (kind) {
    case FieldKind::kInteger:
      return model::ValueKind::kInteger;
    case FieldKind::kFloat:
      return model::ValueKind::kFloat;
    case FieldKind::kBoolean:
      return model::ValueKind::kBoolean;
    case FieldKind::kString:
      return model::ValueKind::kString;
    case FieldKind::kVector2:
      return model::ValueKind::kVector2;
    case FieldKind::kVector3:
      return model::ValueKind::kVector3;
    case FieldKind::kColor:
      return model::ValueKind::kColor;
    case FieldKind::kEnum:
      return model::ValueKind::kEnum;
    case FieldKind::kObject:
      return model::ValueKind::kObject;
    case FieldKind::kRecordRef:
      return model::ValueKind::kRecordRef;
    case FieldKind::kDelegate:
      return model::ValueKind::kNull;
  }
  return model::ValueKind::kNull;
}

RecordType::RecordType(std::string name, const RecordType* base, std::string category)
    : name_(std::move(name)), base_(base), category_(category.empty() ? "Other" : std::move(category)) {
}

const FieldDefinition& RecordType::AddField(FieldDefinition field) {
  if (FindOwnField(field.name)) {
    throw util::AlreadyExists("field '" + field.name + "' already declared on type '" + name_ + "'");
  }
  fields_.push_back(std::move(field));
  return fields_.back();
}

const FieldDefinition* RecordType::FindOwnField(std::string_view field_name) const {
  auto it = std::find_if(fields_.begin(), fields_.end(), [&](const FieldDefinition& f) { return f.name == field_name; });
  return it == fields_.end() ? nullptr : &*it;
}

bool RecordType::IsA(const RecordType& other) const {
  for (const RecordType* type = this; type; type = type->base()) {
    if (type == &other) return true;
  }
  return false;
}

} // namespace datalens::schema
