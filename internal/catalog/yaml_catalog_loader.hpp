#pragma once

#include <memory>
#include <string>

#include "internal/model/record.hpp"
#include "internal/schema/type_registry.hpp"

namespace YAML {
class Node;
}

namespace datalens::catalog {

struct LoadedCatalog {
  std::shared_ptr<schema::TypeRegistry> types;
  model::RecordSet                      records;
};

/*
  Reads a catalog document: record types first, then records.

    types:
      - name: WeaponData
        base: ItemData          # optional, may be declared later in the list
        category: Items         # optional, defaults to "Other"
        fields:
          - {name: damage, kind: int}
          - {name: rarity, kind: enum, options: [Common, Rare]}
    records:
      - id: items/sword
        type: WeaponData
        name: Sword             # optional, defaults to the last path segment
        fields:
          damage: 12
          rarity: Rare
          upgrade: items/great_sword

  Field values are parsed by their declared kind. Vectors and colors take
  sequences, objects take {type, label}, record references take an
  identity or {ref: identity}. Any malformed entry throws
  std::runtime_error naming the entry.
*/
class YamlCatalogLoader {
 public:
  static LoadedCatalog LoadFromFile(const std::string& path);
  static LoadedCatalog LoadFromString(const std::string& document);

 private:
  static LoadedCatalog Load(const YAML::Node& root, const std::string& origin);
};

} // namespace datalens::catalog
