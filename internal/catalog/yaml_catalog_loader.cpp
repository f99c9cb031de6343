#include "yaml_catalog_loader.hpp"

#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <initializer_list>
#include <stdexcept>

#include "internal/model/dynamic_record.hpp"
#include "internal/observability/logging.hpp"

namespace datalens::catalog {

using observability::SizeField;
using observability::StringField;

namespace {

[[noreturn]] void Fail(const std::string& origin, const std::string& what) {
  throw std::runtime_error(origin + ": " + what);
}

std::string RequiredString(const YAML::Node& node, const char* key, const std::string& origin, const std::string& context) {
  const auto child = node[key];
  if (!child || !child.IsScalar() || child.Scalar().empty()) {
    Fail(origin, context + " is missing '" + key + "'");
  }
  return child.Scalar();
}

std::string OptionalString(const YAML::Node& node, const char* key) {
  const auto child = node[key];
  if (!child || !child.IsScalar()) return {};
  return child.Scalar();
}

std::string DefaultName(const std::string& identity) {
  const auto slash = identity.find_last_of('/');
  auto       name  = slash == std::string::npos ? identity : identity.substr(slash + 1);
  const auto dot   = name.find_last_of('.');
  if (dot != std::string::npos && dot > 0) name.erase(dot);
  return name;
}

const schema::FieldDefinition* FindDeclaredField(const schema::RecordType& type, const std::string& field_name) {
  for (const schema::RecordType* t = &type; t; t = t->base()) {
    if (const auto* field = t->FindOwnField(field_name)) return field;
  }
  return nullptr;
}

std::vector<double> Components(const YAML::Node& node, std::initializer_list<const char*> keys) {
  std::vector<double> out;
  if (node.IsSequence()) {
    for (const auto& item : node) out.push_back(item.as<double>());
  } else if (node.IsMap()) {
    for (const char* key : keys) {
      if (node[key]) out.push_back(node[key].as<double>());
    }
  } else {
    throw std::runtime_error("expected a sequence or a map");
  }
  return out;
}

model::Value ParseEnum(const YAML::Node& node, const schema::FieldDefinition& field) {
  const auto& options = field.enum_options;
  if (!node.IsScalar()) throw std::runtime_error("expected an enum name or ordinal");

  const auto it = std::find(options.begin(), options.end(), node.Scalar());
  if (it != options.end()) {
    return model::EnumValue{*it, static_cast<std::int64_t>(it - options.begin())};
  }

  std::int64_t ordinal = 0;
  if (YAML::convert<std::int64_t>::decode(node, ordinal)) {
    if (ordinal >= 0 && static_cast<size_t>(ordinal) < options.size()) {
      return model::EnumValue{options[static_cast<size_t>(ordinal)], ordinal};
    }
    if (options.empty()) {
      return model::EnumValue{std::to_string(ordinal), ordinal};
    }
    throw std::runtime_error("enum ordinal " + std::to_string(ordinal) + " out of range");
  }

  if (options.empty()) {
    return model::EnumValue{node.Scalar(), 0};
  }
  throw std::runtime_error("'" + node.Scalar() + "' is not one of the declared options");
}

model::Value ParseValue(const YAML::Node& node, const schema::FieldDefinition& field) {
  if (!node || node.IsNull()) return model::Value::Null();

  switch (field.kind) {
    case schema::FieldKind::kInteger:
      return node.as<std::int64_t>();
    case schema::FieldKind::kFloat:
      return node.as<double>();
    case schema::FieldKind::kBoolean:
      return node.as<bool>();
    case schema::FieldKind::kString:
      return node.as<std::string>();
    case schema::FieldKind::kVector2: {
      const auto c = Components(node, {"x", "y"});
      if (c.size() != 2) throw std::runtime_error("vector2 needs 2 components");
      return model::Vector2{c[0], c[1]};
    }
    case schema::FieldKind::kVector3: {
      const auto c = Components(node, {"x", "y", "z"});
      if (c.size() != 3) throw std::runtime_error("vector3 needs 3 components");
      return model::Vector3{c[0], c[1], c[2]};
    }
    case schema::FieldKind::kColor: {
      const auto c = Components(node, {"r", "g", "b", "a"});
      if (c.size() != 3 && c.size() != 4) throw std::runtime_error("color needs 3 or 4 components");
      return model::Color{c[0], c[1], c[2], c.size() == 4 ? c[3] : 1.0};
    }
    case schema::FieldKind::kEnum:
      return ParseEnum(node, field);
    case schema::FieldKind::kObject:
      if (node.IsScalar()) return model::ObjectRef{"Object", node.Scalar()};
      if (!node.IsMap()) throw std::runtime_error("expected an object label or {type, label}");
      return model::ObjectRef{OptionalString(node, "type"), OptionalString(node, "label")};
    case schema::FieldKind::kRecordRef:
      if (node.IsScalar()) return model::RecordRef{node.Scalar()};
      if (node.IsMap() && node["ref"]) return model::RecordRef{node["ref"].as<std::string>()};
      throw std::runtime_error("expected a record identity or {ref: identity}");
    case schema::FieldKind::kDelegate:
      throw std::runtime_error("delegate fields hold no value");
  }
  return model::Value::Null();
}

// Registers types in dependency order so a base may be declared after the
// types deriving from it.
void LoadTypes(const YAML::Node& types, schema::TypeRegistry& registry, const std::string& origin) {
  if (!types) return;
  if (!types.IsSequence()) Fail(origin, "'types' must be a sequence");

  std::vector<YAML::Node> pending(types.begin(), types.end());
  while (!pending.empty()) {
    std::vector<YAML::Node> deferred;
    for (const auto& entry : pending) {
      const auto name = RequiredString(entry, "name", origin, "type entry");
      const auto base = OptionalString(entry, "base");
      if (!base.empty() && !registry.Find(base)) {
        deferred.push_back(entry);
        continue;
      }

      auto& type = [&]() -> schema::RecordType& {
        try {
          return registry.Register(name, base, OptionalString(entry, "category"));
        } catch (const std::exception& e) {
          Fail(origin, "type '" + name + "': " + e.what());
        }
      }();

      const auto fields = entry["fields"];
      if (!fields) continue;
      if (!fields.IsSequence()) Fail(origin, "type '" + name + "': 'fields' must be a sequence");
      for (const auto& f : fields) {
        schema::FieldDefinition definition;
        definition.name      = RequiredString(f, "name", origin, "field of type '" + name + "'");
        const auto kind_text = RequiredString(f, "kind", origin, "field '" + name + "." + definition.name + "'");
        const auto kind      = schema::ParseFieldKind(kind_text);
        if (!kind) Fail(origin, "field '" + name + "." + definition.name + "': unknown kind '" + kind_text + "'");
        definition.kind = *kind;
        if (const auto options = f["options"]) {
          try {
            definition.enum_options = options.as<std::vector<std::string>>();
          } catch (const YAML::Exception& e) {
            Fail(origin, "field '" + name + "." + definition.name + "': bad options: " + e.what());
          }
        }
        try {
          type.AddField(std::move(definition));
        } catch (const std::exception& e) {
          Fail(origin, "type '" + name + "': " + e.what());
        }
      }
    }

    if (deferred.size() == pending.size()) {
      Fail(origin, "type '" + OptionalString(deferred.front(), "name") + "' has an unknown base '" + OptionalString(deferred.front(), "base") + "'");
    }
    pending = std::move(deferred);
  }
}

model::RecordSet LoadRecords(const YAML::Node& records, const std::shared_ptr<const schema::TypeRegistry>& registry, const std::string& origin) {
  model::RecordSet out;
  if (!records) return out;
  if (!records.IsSequence()) Fail(origin, "'records' must be a sequence");

  for (const auto& entry : records) {
    const auto identity  = RequiredString(entry, "id", origin, "record entry");
    const auto type_name = RequiredString(entry, "type", origin, "record '" + identity + "'");
    const auto* type     = registry->Find(type_name);
    if (!type) Fail(origin, "record '" + identity + "': unknown type '" + type_name + "'");

    auto name = OptionalString(entry, "name");
    if (name.empty()) name = DefaultName(identity);

    auto record = std::make_shared<model::DynamicRecord>(identity, std::move(name), schema::TypeRegistry::Share(registry, *type));

    const auto fields = entry["fields"];
    if (fields && !fields.IsMap()) Fail(origin, "record '" + identity + "': 'fields' must be a map");
    if (fields) {
      for (const auto& kv : fields) {
        const auto  field_name = kv.first.as<std::string>();
        const auto* field      = FindDeclaredField(*type, field_name);
        if (!field) Fail(origin, "record '" + identity + "': field '" + field_name + "' is not declared on " + type_name);
        try {
          record->Set(field_name, ParseValue(kv.second, *field));
        } catch (const std::exception& e) {
          Fail(origin, "record '" + identity + "' field '" + field_name + "': " + e.what());
        }
      }
    }
    out.push_back(std::move(record));
  }
  return out;
}

} // namespace

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

LoadedCatalog YamlCatalogLoader::LoadFromFile(const std::string& path) {
  YAML::Node root;
  try {
    root = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load catalog: " + std::string(e.what()));
  }
  return Load(root, path);
}

LoadedCatalog YamlCatalogLoader::LoadFromString(const std::string& document) {
  YAML::Node root;
  try {
    root = YAML::Load(document);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to parse catalog: " + std::string(e.what()));
  }
  return Load(root, "<inline>");
}

LoadedCatalog YamlCatalogLoader::Load(const YAML::Node& root, const std::string& origin) {
  if (root.IsNull()) {
    return {std::make_shared<schema::TypeRegistry>(), {}};
  }
  if (!root.IsMap()) Fail(origin, "catalog root must be a map");

  LoadedCatalog catalog;
  catalog.types = std::make_shared<schema::TypeRegistry>();
  LoadTypes(root["types"], *catalog.types, origin);
  catalog.records = LoadRecords(root["records"], catalog.types, origin);

  DATALENS_LOG_INFO("catalog loaded", {StringField("origin", origin), SizeField("types", catalog.types->Size()),
                                       SizeField("records", catalog.records.size())});
  return catalog;
}

} // namespace datalens::catalog
