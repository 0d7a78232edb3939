#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <stdexcept>

namespace sda::config {

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

static void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  std::string scalar_value = node.Scalar();

  // quoted scalars ("1234", 'true') keep their string type
  if (node.Tag() == "!") {
    value->set_string_value(scalar_value);
    return;
  }

  // detect numeric / bool
  if (scalar_value == "true" || scalar_value == "false") {
    value->set_bool_value(scalar_value == "true");
    return;
  }

  char*        endptr        = nullptr;
  const double numeric_value = strtod(scalar_value.c_str(), &endptr);
  if (!scalar_value.empty() && endptr && *endptr == '\0') {
    value->set_number_value(numeric_value);
    return;
  }

  value->set_string_value(scalar_value);
}

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value) {
  switch (node.Type()) {
    case YAML::NodeType::Null:
      value->set_null_value(google::protobuf::NullValue::NULL_VALUE);
      break;

    case YAML::NodeType::Scalar:
      SetScalarValue(node, value);
      break;

    case YAML::NodeType::Sequence: {
      auto* list_value = value->mutable_list_value();
      for (size_t i = 0; i < node.size(); ++i) {
        YamlToProtoValue(node[i], list_value->add_values());
      }
      break;
    }

    case YAML::NodeType::Map: {
      auto* struct_value = value->mutable_struct_value();
      for (auto it : node) {
        YamlToProtoValue(it.second, &(*struct_value->mutable_fields())[it.first.Scalar()]);
      }
      break;
    }

    default:
      throw std::runtime_error("Unsupported YAML node");
  }
}

static void OverrideFromEnv(const char* name, std::string* target) {
  if (const char* value = std::getenv(name)) {
    *target = value;
  }
}

static void Require(bool condition, const std::string& setting) {
  if (!condition) {
    throw std::runtime_error("Invalid configuration: missing " + setting);
  }
}

static void ValidateStorage(const sda::runtime::config::StorageConfig& storage, const std::string& role) {
  using sda::runtime::config::StorageConfig;

  switch (storage.backend_case()) {
    case StorageConfig::kPosix:
      Require(!storage.posix().location().empty(), role + ".posix.location");
      return;
    case StorageConfig::kS3:
      Require(!storage.s3().url().empty(), role + ".s3.url");
      Require(!storage.s3().bucket().empty(), role + ".s3.bucket");
      Require(!storage.s3().access_key().empty(), role + ".s3.access_key");
      Require(!storage.s3().secret_key().empty(), role + ".s3.secret_key");
      return;
    case StorageConfig::BACKEND_NOT_SET:
      break;
  }
  throw std::runtime_error("Invalid configuration: " + role + " needs a posix or s3 section");
}

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

sda::runtime::config::RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML config: " + std::string(e.what()));
  }

  google::protobuf::Value json_value;
  YamlToProtoValue(yaml, &json_value);

  std::string json;
  auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
  if (!to_json_status.ok()) {
    throw std::runtime_error("Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
  }

  sda::runtime::config::RuntimeConfig config;

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);

  if (!status.ok()) {
    throw std::runtime_error("Invalid configuration: " + std::string(status.message()));
  }

  return config;
}

void ConfigLoader::ApplyEnvironmentOverrides(sda::runtime::config::RuntimeConfig& config) {
  OverrideFromEnv("SDA_BROKER_PASSWORD", config.mutable_broker()->mutable_password());
  OverrideFromEnv("C4GH_PASSPHRASE", config.mutable_c4gh()->mutable_passphrase());

  if (const char* uri = std::getenv("SDA_DB_CONNECTION_URI")) {
    config.mutable_database()->mutable_postgres()->set_connection_uri(uri);
  }
}

void ConfigLoader::Validate(const sda::runtime::config::RuntimeConfig& config, WorkerKind kind) {
  const auto& broker = config.broker();
  Require(!broker.host().empty(), "broker.host");
  Require(!broker.queue().empty(), "broker.queue");
  Require(!broker.routing_key().empty(), "broker.routing_key");
  Require(!broker.routing_error().empty(), "broker.routing_error");

  const auto& database = config.database();
  Require(database.has_postgres() || database.has_sqlite(), "database.postgres or database.sqlite");
  if (database.has_postgres()) {
    Require(!database.postgres().connection_uri().empty(), "database.postgres.connection_uri");
  } else {
    Require(!database.sqlite().path().empty(), "database.sqlite.path");
  }

  Require(config.has_archive(), "archive");
  ValidateStorage(config.archive(), "archive");

  if (kind == WorkerKind::kSync) {
    Require(config.has_backup(), "backup");
    ValidateStorage(config.backup(), "backup");
  } else {
    Require(!config.c4gh().key_path().empty(), "c4gh.key_path");
  }
}

} // namespace sda::config
