#pragma once

#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "internal/model/dynamic_record.hpp"
#include "internal/schema/type_registry.hpp"

namespace datalens::testing {

using FieldValues = std::vector<std::pair<std::string, model::Value>>;

inline std::shared_ptr<model::DynamicRecord> MakeRecord(const std::shared_ptr<schema::TypeRegistry>& types, const std::string& type_name,
                                                        const std::string& identity, const std::string& name, const FieldValues& values = {}) {
  const auto* type   = types->Find(type_name);
  auto        record = std::make_shared<model::DynamicRecord>(identity, name, schema::TypeRegistry::Share(types, *type));
  for (const auto& [field, value] : values) {
    record->Set(field, value);
  }
  return record;
}

// Unit (name:string, hp:int, target:record) registered as "Unit".
inline std::shared_ptr<schema::TypeRegistry> MakeUnitRegistry() {
  auto  types = std::make_shared<schema::TypeRegistry>();
  auto& unit  = types->Register("Unit", {}, "Characters");
  unit.AddField({"name", schema::FieldKind::kString, {}});
  unit.AddField({"hp", schema::FieldKind::kInteger, {}});
  unit.AddField({"target", schema::FieldKind::kRecordRef, {}});
  return types;
}

} // namespace datalens::testing
