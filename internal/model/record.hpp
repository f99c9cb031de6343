#pragma once

#include <memory>
#include <string>
#include <vector>

#include "internal/model/value.hpp"
#include "internal/schema/field_descriptor.hpp"
#include "internal/schema/record_type.hpp"

namespace datalens::model {

/*
  Externally owned data record.

  The core only observes records: identity, runtime type, display name and
  field values. Identity must be stable and derivable without mutation.
*/
class Record {
 public:
  virtual ~Record() = default;

  virtual const std::string&        Identity() const = 0;
  virtual const std::string&        Name() const     = 0;
  virtual const schema::RecordType& Type() const     = 0;

  // May throw. Query code reads through query::FieldAccessor::GetValue,
  // which turns failures into null.
  virtual Value Get(const schema::FieldDescriptor& field) const = 0;
};

using RecordPtr = std::shared_ptr<const Record>;
using RecordSet = std::vector<RecordPtr>;

} // namespace datalens::model
