#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cmath>
#include <cstdlib>
#include <stdexcept>

#include "internal/observability/logging.hpp"

namespace datalens::config {

using datalens::runtime::config::RuntimeConfig;

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

static void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  const std::string& scalar_value = node.Scalar();

  // quoted scalars stay strings
  if (node.Tag() == "!") {
    value->set_string_value(scalar_value);
    return;
  }

  if (scalar_value == "true" || scalar_value == "false") {
    value->set_bool_value(scalar_value == "true");
    return;
  }

  // "inf" and "nan" parse as numbers but have no JSON form
  char*        endptr        = nullptr;
  const double numeric_value = std::strtod(scalar_value.c_str(), &endptr);
  if (!scalar_value.empty() && endptr && *endptr == '\0' && std::isfinite(numeric_value)) {
    value->set_number_value(numeric_value);
    return;
  }

  value->set_string_value(scalar_value);
}

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value) {
  switch (node.Type()) {
    case YAML::NodeType::Null:
    case YAML::NodeType::Undefined:
      value->set_null_value(google::protobuf::NullValue::NULL_VALUE);
      break;

    case YAML::NodeType::Scalar:
      SetScalarValue(node, value);
      break;

    case YAML::NodeType::Sequence: {
      auto* list_value = value->mutable_list_value();
      for (const auto& item : node) {
        YamlToProtoValue(item, list_value->add_values());
      }
      break;
    }

    case YAML::NodeType::Map: {
      auto* struct_value = value->mutable_struct_value();
      for (const auto& entry : node) {
        YamlToProtoValue(entry.second, &(*struct_value->mutable_fields())[entry.first.Scalar()]);
      }
      break;
    }
  }
}

static void RequireNonEmptyNames(const google::protobuf::RepeatedPtrField<std::string>& names, const std::string& key) {
  for (const auto& name : names) {
    if (name.empty()) {
      throw std::runtime_error("Invalid configuration: " + key + " must not contain empty names");
    }
  }
}

static RuntimeConfig FromNode(const YAML::Node& yaml, const std::filesystem::path& base_dir) {
  RuntimeConfig config;
  // an empty document is a valid, all-default config
  if (yaml.IsNull()) {
    return config;
  }
  if (!yaml.IsMap()) {
    throw std::runtime_error("Invalid configuration: top level must be a map");
  }

  google::protobuf::Value json_value;
  YamlToProtoValue(yaml, &json_value);

  std::string json;
  auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
  if (!to_json_status.ok()) {
    throw std::runtime_error("Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
  }

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);
  if (!status.ok()) {
    throw std::runtime_error("Invalid configuration: " + std::string(status.message()));
  }

  const std::filesystem::path catalog_path = config.catalog().path();
  if (!catalog_path.empty() && catalog_path.is_relative() && !base_dir.empty()) {
    config.mutable_catalog()->set_path((base_dir / catalog_path).lexically_normal().string());
  }
  return config;
}

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML config: " + std::string(e.what()));
  }

  auto config = FromNode(yaml, std::filesystem::path(path).parent_path());
  Validate(config);
  return config;
}

RuntimeConfig ConfigLoader::LoadFromYamlString(const std::string& yaml_text, const std::filesystem::path& base_dir) {
  YAML::Node yaml;
  try {
    yaml = YAML::Load(yaml_text);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to parse YAML config: " + std::string(e.what()));
  }

  auto config = FromNode(yaml, base_dir);
  Validate(config);
  return config;
}

void ConfigLoader::Validate(const RuntimeConfig& config) {
  if (!config.logging().level().empty()) {
    try {
      (void)observability::ParseLevel(config.logging().level());
    } catch (const std::exception& e) {
      throw std::runtime_error("Invalid configuration: logging.level: " + std::string(e.what()));
    }
  }
  RequireNonEmptyNames(config.graph().orphan_excluded_types(), "graph.orphan_excluded_types");
  RequireNonEmptyNames(config.query().reserved_field_names(), "query.reserved_field_names");
}

} // namespace datalens::config
