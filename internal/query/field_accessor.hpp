#pragma once

#include <cstddef>
#include <functional>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "internal/model/record.hpp"
#include "internal/schema/field_descriptor.hpp"

namespace datalens::query {

/*
  Resolves field names against the registered schema.

  Resolve() walks the type, then its base chain; the most derived
  declaration wins. Reserved host bookkeeping names and delegate fields are
  never resolvable. Results (hits and misses) are cached per (type, name)
  for the lifetime of the accessor; call ClearCache() after a schema change.
*/
class FieldAccessor {
 public:
  FieldAccessor() = default;
  explicit FieldAccessor(std::vector<std::string> extra_reserved_names);

  std::optional<schema::FieldDescriptor> Resolve(const schema::RecordType& type, std::string_view field_name) const;

  // Never throws: a failing read is logged and yields null.
  model::Value GetValue(const model::Record& record, const schema::FieldDescriptor& descriptor) const;

  // Own fields in declaration order, then inherited ones that are not
  // shadowed. Reserved and delegate fields are skipped.
  std::vector<schema::FieldDescriptor> QueryableFields(const schema::RecordType& type) const;

  void   ClearCache();
  size_t CacheSize() const;

  static bool IsBuiltinReservedName(std::string_view field_name);

 private:
  struct CacheKey {
    const schema::RecordType* type;
    std::string               name;

    bool operator==(const CacheKey&) const = default;
  };

  struct CacheKeyHash {
    size_t operator()(const CacheKey& key) const {
      return std::hash<const void*>{}(key.type) ^ (std::hash<std::string>{}(key.name) << 1);
    }
  };

  bool IsHidden(std::string_view field_name) const;

  std::unordered_set<std::string> extra_reserved_;

  mutable std::shared_mutex                                                           mutex_;
  mutable std::unordered_map<CacheKey, std::optional<schema::FieldDescriptor>, CacheKeyHash> cache_;
};

} // namespace datalens::query
