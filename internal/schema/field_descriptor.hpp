#pragma once

#include <string>

#include "record_type.hpp"

namespace datalens::schema {

/*
  Resolved field: the declaration found for (type, name), together with
  the type in the base chain that declared it.
*/
struct FieldDescriptor {
  std::string       name;
  FieldKind         kind  = FieldKind::kString;
  const RecordType* owner = nullptr;
};

} // namespace datalens::schema
