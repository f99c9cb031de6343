#pragma once

#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "record_type.hpp"

namespace datalens::schema {

/*
  Registration-based schema.

  Every record type registers its queryable fields explicitly; the field
  accessor resolves names against these declarations instead of runtime
  reflection. Types are heap-allocated so pointers handed to records stay
  valid for the lifetime of the registry.
*/
class TypeRegistry {
 public:
  // Throws AlreadyExists on a duplicate name and NotFound when base_name
  // is non-empty but not registered yet.
  RecordType& Register(const std::string& name, const std::string& base_name = {}, const std::string& category = {});

  const RecordType* Find(std::string_view name) const;
  RecordType*       FindMutable(std::string_view name);

  // Registration order.
  std::vector<const RecordType*> Types() const;

  size_t Size() const {
    return types_.size();
  }

  // Handle that shares ownership of the whole registry, so the type and its
  // base chain outlive any record holding it.
  static std::shared_ptr<const RecordType> Share(const std::shared_ptr<const TypeRegistry>& registry, const RecordType& type);

 private:
  std::vector<std::unique_ptr<RecordType>>     types_;
  std::unordered_map<std::string, RecordType*> by_name_;
};

} // namespace datalens::schema
