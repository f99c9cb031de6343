#pragma once

#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <vector>

#include "internal/model/record.hpp"
#include "internal/util/time.hpp"

namespace datalens::catalog {

class RecordSource;

// Node of the category tree. Folders have no type and count the records of
// their children.
struct TypeNode {
  std::string               display_name;
  const schema::RecordType* type         = nullptr;
  size_t                    record_count = 0;
  std::vector<TypeNode>     children;

  bool IsFolder() const {
    return type == nullptr;
  }
};

// "WeaponDefinition" -> "Weapon". At most one suffix is stripped and a
// name that is only the suffix is kept as is.
std::string TypeDisplayName(std::string_view type_name);

/*
  Snapshot of the record set grouped by runtime type, plus the category
  tree shown to users. Folders and the types inside them are sorted by
  display name.
*/
class ScanResult {
 public:
  static ScanResult Scan(const RecordSource& source, util::TimePoint scanned_at = util::Now());

  const std::map<std::string, model::RecordSet, std::less<>>& RecordsByType() const {
    return records_by_type_;
  }

  // Empty when no record has this type.
  const model::RecordSet& RecordsOfType(std::string_view type_name) const;

  const std::vector<TypeNode>& Categories() const {
    return categories_;
  }

  size_t TotalRecordCount() const {
    return total_records_;
  }

  size_t TotalTypeCount() const {
    return records_by_type_.size();
  }

  util::TimePoint scanned_at() const {
    return scanned_at_;
  }

 private:
  std::map<std::string, model::RecordSet, std::less<>> records_by_type_;
  std::vector<TypeNode>                                categories_;
  size_t                                               total_records_ = 0;
  util::TimePoint                                      scanned_at_{};
};

} // namespace datalens::catalog
