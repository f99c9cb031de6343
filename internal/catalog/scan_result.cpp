#include "scan_result.hpp"

#include <algorithm>
#include <array>

#include "internal/catalog/record_source.hpp"

namespace datalens::catalog {

namespace {

void SortByDisplayName(std::vector<TypeNode>& nodes) {
  std::sort(nodes.begin(), nodes.end(), [](const TypeNode& a, const TypeNode& b) { return a.display_name < b.display_name; });
}

} // namespace

std::string TypeDisplayName(std::string_view type_name) {
  // longer suffixes first so "ConfigSO" wins over "SO"
  static constexpr std::array<std::string_view, 6> kSuffixes = {"Definition", "ConfigSO", "Config", "Data", "Base", "SO"};
  for (const auto suffix : kSuffixes) {
    if (type_name.size() > suffix.size() && type_name.ends_with(suffix)) {
      return std::string(type_name.substr(0, type_name.size() - suffix.size()));
    }
  }
  return std::string(type_name);
}

ScanResult ScanResult::Scan(const RecordSource& source, util::TimePoint scanned_at) {
  ScanResult result;
  result.scanned_at_ = scanned_at;

  for (auto& record : source.ListAllRecords()) {
    if (!record) continue;
    result.records_by_type_[record->Type().name()].push_back(std::move(record));
    ++result.total_records_;
  }

  std::map<std::string, TypeNode> folders;
  for (const auto& [type_name, records] : result.records_by_type_) {
    const auto& type = records.front()->Type();

    auto& folder        = folders[type.category()];
    folder.display_name = type.category();
    folder.record_count += records.size();

    TypeNode node;
    node.display_name = TypeDisplayName(type_name);
    node.type         = &type;
    node.record_count = records.size();
    folder.children.push_back(std::move(node));
  }

  for (auto& [_, folder] : folders) {
    SortByDisplayName(folder.children);
    result.categories_.push_back(std::move(folder));
  }
  SortByDisplayName(result.categories_);
  return result;
}

const model::RecordSet& ScanResult::RecordsOfType(std::string_view type_name) const {
  static const model::RecordSet kEmpty;
  auto                          it = records_by_type_.find(type_name);
  return it == records_by_type_.end() ? kEmpty : it->second;
}

} // namespace datalens::catalog
