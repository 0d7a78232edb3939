#pragma once

#include <string>

#include "config/config.pb.h"

namespace sda::config {

enum class WorkerKind { kSync, kVerify };

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf.
  Unknown keys are rejected.
*/
class ConfigLoader {
 public:
  static sda::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  // Secrets from the environment win over the file:
  //   SDA_BROKER_PASSWORD, SDA_DB_CONNECTION_URI, C4GH_PASSPHRASE
  static void ApplyEnvironmentOverrides(sda::runtime::config::RuntimeConfig& config);

  // Throws std::runtime_error naming the first missing setting.
  static void Validate(const sda::runtime::config::RuntimeConfig& config, WorkerKind kind);
};

} // namespace sda::config
