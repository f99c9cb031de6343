#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "internal/model/value.hpp"

namespace datalens::schema {

/*
  Declared kind of a field. Mirrors model::ValueKind for value-carrying
  fields; kDelegate marks callback/event slots, which hold no comparable
  value and are never queryable.
*/
enum class FieldKind : std::uint8_t {
  kInteger,
  kFloat,
  kBoolean,
  kString,
  kVector2,
  kVector3,
  kColor,
  kEnum,
  kObject,
  kRecordRef,
  kDelegate,
};

std::string_view ToString(FieldKind kind);
std::optional<FieldKind> ParseFieldKind(std::string_view text);

// Value kind stored by a field of the given kind. Delegates map to kNull.
model::ValueKind ValueKindOf(FieldKind kind);

struct FieldDefinition {
  std::string              name;
  FieldKind                kind = FieldKind::kString;
  std::vector<std::string> enum_options;
};

class RecordType {
 public:
  RecordType(std::string name, const RecordType* base, std::string category);

  const std::string& name() const {
    return name_;
  }

  const RecordType* base() const {
    return base_;
  }

  const std::string& category() const {
    return category_;
  }

  const std::vector<FieldDefinition>& fields() const {
    return fields_;
  }

  // Appends a field declared on this type. Throws AlreadyExists when the
  // name is already declared at this level.
  const FieldDefinition& AddField(FieldDefinition field);

  // Own fields only; the base chain is walked by query::FieldAccessor.
  const FieldDefinition* FindOwnField(std::string_view field_name) const;

  bool IsA(const RecordType& other) const;

 private:
  std::string                  name_;
  const RecordType*            base_;
  std::string                  category_;
  std::vector<FieldDefinition> fields_;
};

} // namespace datalens::schema
