#pragma once

#include <memory>
#include <string>
#include <unordered_map>

#include "internal/model/record.hpp"

namespace datalens::model {

/*
  Record whose field values are held in a name-keyed map. Used by the
  in-memory record source and the YAML catalog loader.
*/
class DynamicRecord : public Record {
 public:
  // Throws InvalidArgument when type is null.
  DynamicRecord(std::string identity, std::string name, std::shared_ptr<const schema::RecordType> type);

  const std::string& Identity() const override {
    return identity_;
  }

  const std::string& Name() const override {
    return name_;
  }

  const schema::RecordType& Type() const override {
    return *type_;
  }

  Value Get(const schema::FieldDescriptor& field) const override;

  // Throws InvalidArgument when the field is not declared on the type chain,
  // is a delegate, or the value kind does not match the declaration.
  void Set(const std::string& field_name, Value value);

 private:
  std::string                               identity_;
  std::string                               name_;
  std::shared_ptr<const schema::RecordType> type_;
  std::unordered_map<std::string, Value>    values_;
};

} // namespace datalens::model
