#include "internal/catalog/yaml_catalog_loader.hpp"

#include <cassert>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

#include "internal/query/field_accessor.hpp"

namespace {

using datalens::catalog::LoadedCatalog;
using datalens::catalog::YamlCatalogLoader;
using datalens::model::Value;
using datalens::query::FieldAccessor;

constexpr const char* kCatalog = R"(
types:
  - name: WeaponDefinition
    base: ItemBase
    category: Items
    fields:
      - {name: damage, kind: float}
      - {name: upgradesTo, kind: record}
      - {name: onHit, kind: delegate}
  - name: ItemBase
    fields:
      - {name: price, kind: int}
      - {name: rarity, kind: enum, options: [Common, Rare]}
      - {name: icon, kind: object}
      - {name: tint, kind: color}
      - {name: offset, kind: vector2}
      - {name: tradeable, kind: bool}
      - {name: label, kind: string}
records:
  - id: items/iron_sword.asset
    type: WeaponDefinition
    fields:
      damage: 8
      price: 40
      rarity: Rare
      icon: {type: Texture2D, label: iron_icon}
      tint: [1, 0.5, 0]
      offset: {x: 1, y: 2}
      tradeable: true
      label: "42"
      upgradesTo: {ref: items/steel_sword.asset}
  - id: items/steel_sword.asset
    type: WeaponDefinition
    name: Steel Sword
    fields:
      rarity: 0
)";

Value Read(const LoadedCatalog& catalog, size_t index, const std::string& field) {
  FieldAccessor accessor;
  const auto&   record     = *catalog.records.at(index);
  auto          descriptor = accessor.Resolve(record.Type(), field);
  assert(descriptor.has_value());
  return accessor.GetValue(record, *descriptor);
}

bool LoadFails(const std::string& document) {
  try {
    (void)YamlCatalogLoader::LoadFromString(document);
  } catch (const std::runtime_error&) {
    return true;
  }
  return false;
}

void TestTypesRegisterWithForwardBase() {
  const auto catalog = YamlCatalogLoader::LoadFromString(kCatalog);
  assert(catalog.types->Size() == 2);

  const auto* weapon = catalog.types->Find("WeaponDefinition");
  assert(weapon != nullptr);
  assert(weapon->base() == catalog.types->Find("ItemBase"));
  assert(weapon->category() == "Items");
  assert(catalog.types->Find("ItemBase")->category() == "Other");
}

void TestRecordsKeepDocumentOrderAndNames() {
  const auto catalog = YamlCatalogLoader::LoadFromString(kCatalog);
  assert(catalog.records.size() == 2);
  assert(catalog.records[0]->Identity() == "items/iron_sword.asset");
  assert(catalog.records[0]->Name() == "iron_sword");
  assert(catalog.records[1]->Name() == "Steel Sword");
}

void TestValuesParseByDeclaredKind() {
  const auto catalog = YamlCatalogLoader::LoadFromString(kCatalog);

  assert(Read(catalog, 0, "damage") == Value(8.0));
  assert(Read(catalog, 0, "price") == Value(40));
  assert(Read(catalog, 0, "rarity") == Value(datalens::model::EnumValue{"Rare", 1}));
  assert(Read(catalog, 0, "icon") == Value(datalens::model::ObjectRef{"Texture2D", "iron_icon"}));
  assert(Read(catalog, 0, "tint") == Value(datalens::model::Color{1, 0.5, 0, 1}));
  assert(Read(catalog, 0, "offset") == Value(datalens::model::Vector2{1, 2}));
  assert(Read(catalog, 0, "tradeable") == Value(true));
  assert(Read(catalog, 0, "label") == Value("42"));
  assert(Read(catalog, 0, "upgradesTo") == Value(datalens::model::RecordRef{"items/steel_sword.asset"}));

  assert(Read(catalog, 1, "rarity") == Value(datalens::model::EnumValue{"Common", 0}));
  assert(Read(catalog, 1, "damage").IsNull());
}

void TestRecordsOutliveLoadedRegistryHandle() {
  auto catalog = YamlCatalogLoader::LoadFromString(kCatalog);
  auto record  = catalog.records[0];
  catalog      = LoadedCatalog{};

  assert(record->Type().name() == "WeaponDefinition");
  assert(record->Type().base()->name() == "ItemBase");
}

void TestMalformedDocumentsAreRejected() {
  assert(LoadFails("- just\n- a list\n"));
  assert(LoadFails("types:\n  - {name: A, base: Missing}\n"));
  assert(LoadFails("types:\n  - {name: A}\n  - {name: A}\n"));
  assert(LoadFails("types:\n  - name: A\n    fields:\n      - {name: f, kind: quaternion}\n"));
  assert(LoadFails("types:\n  - {name: A}\nrecords:\n  - {id: r, type: B}\n"));
  assert(LoadFails("types:\n  - {name: A}\nrecords:\n  - {type: A}\n"));
  assert(LoadFails("types:\n  - name: A\n    fields:\n      - {name: n, kind: int}\nrecords:\n  - {id: r, type: A, fields: {n: many}}\n"));
  assert(LoadFails("types:\n  - name: A\n    fields:\n      - {name: n, kind: int}\nrecords:\n  - {id: r, type: A, fields: {undeclared: 1}}\n"));
  assert(LoadFails("types:\n  - name: A\n    fields:\n      - {name: e, kind: enum, options: [X]}\nrecords:\n  - {id: r, type: A, fields: {e: Y}}\n"));
  assert(LoadFails("types:\n  - name: A\n    fields:\n      - {name: v, kind: vector3}\nrecords:\n  - {id: r, type: A, fields: {v: [1, 2]}}\n"));
}

void TestEmptyDocumentYieldsEmptyCatalog() {
  const auto catalog = YamlCatalogLoader::LoadFromString("");
  assert(catalog.types->Size() == 0);
  assert(catalog.records.empty());
}

void TestLoadFromFile() {
  const auto dir = std::filesystem::temp_directory_path() / "datalens_yaml_catalog_loader_tests";
  std::filesystem::create_directories(dir);
  const auto    path = dir / "catalog.yaml";
  std::ofstream out(path);
  out << kCatalog;
  out.close();

  const auto catalog = YamlCatalogLoader::LoadFromFile(path.string());
  assert(catalog.records.size() == 2);

  bool threw = false;
  try {
    (void)YamlCatalogLoader::LoadFromFile((dir / "missing.yaml").string());
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestTypesRegisterWithForwardBase();
  TestRecordsKeepDocumentOrderAndNames();
  TestValuesParseByDeclaredKind();
  TestRecordsOutliveLoadedRegistryHandle();
  TestMalformedDocumentsAreRejected();
  TestEmptyDocumentYieldsEmptyCatalog();
  TestLoadFromFile();

  std::cout << "datalens_unit_yaml_catalog_loader: pass\n";
  return 0;
}
