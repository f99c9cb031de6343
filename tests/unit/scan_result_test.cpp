#include "internal/catalog/scan_result.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>

#include "internal/catalog/memory_record_source.hpp"
#include "test_records.hpp"

namespace {

using datalens::catalog::MemoryRecordSource;
using datalens::catalog::ScanResult;
using datalens::catalog::TypeDisplayName;
using datalens::schema::TypeRegistry;
using datalens::testing::MakeRecord;

void TestDisplayNameStripsOneSuffix() {
  assert(TypeDisplayName("WeaponDefinition") == "Weapon");
  assert(TypeDisplayName("EnemyConfigSO") == "Enemy");
  assert(TypeDisplayName("AudioConfig") == "Audio");
  assert(TypeDisplayName("ItemData") == "Item");
  assert(TypeDisplayName("ItemBase") == "Item");
  assert(TypeDisplayName("LevelSO") == "Level");
  assert(TypeDisplayName("LootTable") == "LootTable");
  assert(TypeDisplayName("DataBase") == "Data");
  assert(TypeDisplayName("Data") == "Data");
}

void TestRecordsAreGroupedIntoCategoryTree() {
  auto types = std::make_shared<TypeRegistry>();
  types->Register("WeaponDefinition", {}, "Items");
  types->Register("ArmorData", {}, "Items");
  types->Register("EnemyConfigSO", {}, "Characters");
  types->Register("GameDatabase");

  MemoryRecordSource source(types);
  source.Add(MakeRecord(types, "WeaponDefinition", "w1", "Sword"));
  source.Add(MakeRecord(types, "WeaponDefinition", "w2", "Axe"));
  source.Add(MakeRecord(types, "ArmorData", "a1", "Vest"));
  source.Add(MakeRecord(types, "EnemyConfigSO", "e1", "Goblin"));
  source.Add(MakeRecord(types, "GameDatabase", "db", "Database"));

  const auto scanned_at = datalens::util::TimePoint(std::chrono::seconds(42));
  const auto scan       = ScanResult::Scan(source, scanned_at);
  assert(scan.TotalRecordCount() == 5);
  assert(scan.TotalTypeCount() == 4);
  assert(scan.scanned_at() == scanned_at);
  assert(scan.RecordsOfType("WeaponDefinition").size() == 2);
  assert(scan.RecordsOfType("WeaponDefinition")[0]->Identity() == "w1");
  assert(scan.RecordsOfType("Missing").empty());

  const auto& categories = scan.Categories();
  assert(categories.size() == 3);
  assert(categories[0].display_name == "Characters");
  assert(categories[1].display_name == "Items");
  assert(categories[2].display_name == "Other");

  const auto& items = categories[1];
  assert(items.IsFolder());
  assert(items.record_count == 3);
  assert(items.children.size() == 2);
  assert(items.children[0].display_name == "Armor");
  assert(items.children[0].record_count == 1);
  assert(items.children[1].display_name == "Weapon");
  assert(items.children[1].type == types->Find("WeaponDefinition"));
  assert(!items.children[1].IsFolder());
}

void TestEmptySource() {
  MemoryRecordSource source;
  const auto         scan = ScanResult::Scan(source);
  assert(scan.TotalRecordCount() == 0);
  assert(scan.Categories().empty());
}

} // namespace

int main() {
  TestDisplayNameStripsOneSuffix();
  TestRecordsAreGroupedIntoCategoryTree();
  TestEmptySource();

  std::cout << "datalens_unit_scan_result: pass\n";
  return 0;
}
