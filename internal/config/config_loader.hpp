#pragma once

#include <filesystem>
#include <string>

#include "config/config.pb.h"

namespace datalens::config {

/*
  Loads RuntimeConfig from YAML.

  YAML is converted to JSON then parsed into protobuf, so unknown keys are
  rejected the same way protobuf's JSON parser rejects them. A relative
  catalog.path is rewritten against base_dir (the directory of the config
  file when loading from disk). Every failure is a std::runtime_error
  naming the problem.
*/
class ConfigLoader {
 public:
  static datalens::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  static datalens::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml, const std::filesystem::path& base_dir = {});

 private:
  static void Validate(const datalens::runtime::config::RuntimeConfig& config);
};

} // namespace datalens::config
