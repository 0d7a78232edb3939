#include "internal/config/config_loader.hpp"

#include <cassert>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

using sda::config::ConfigLoader;
using sda::config::WorkerKind;

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "sda_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

const char* kSyncYaml = R"(logging:
  level: debug
broker:
  host: mq.example.org
  port: 5671
  user: sync
  password: "from-file"
  vhost: sda
  queue: mappings
  exchange: sda
  routing_key: completed
  routing_error: error
  durable: true
  ssl: true
  verify_peer: false
database:
  sqlite:
    path: "/tmp/sda.db"
    wal_mode: true
archive:
  posix:
    location: "/archive"
backup:
  s3:
    url: "https://s3.example.org"
    port: 443
    region: us-east-1
    access_key: access
    secret_key: secret
    bucket: backup
    chunk_size: 16777216
)";

template <typename Fn>
bool Throws(Fn&& fn) {
  try {
    fn();
  } catch (const std::runtime_error&) {
    return true;
  }
  return false;
}

void TestSyncConfigLoads() {
  auto config = ConfigLoader::LoadFromYaml(WriteYaml("sync", kSyncYaml).string());

  assert(config.broker().host() == "mq.example.org");
  assert(config.broker().port() == 5671);
  assert(config.broker().durable());
  assert(config.broker().has_verify_peer() && !config.broker().verify_peer());
  assert(!config.broker().has_publish_confirms());
  assert(config.database().has_sqlite());
  assert(config.archive().posix().location() == "/archive");
  assert(config.backup().s3().chunk_size() == 16777216u);

  ConfigLoader::Validate(config, WorkerKind::kSync);
}

void TestQuotedScalarsKeepStringType() {
  const auto yaml_path = WriteYaml("quoted", R"(broker:
  password: "1234"
c4gh:
  passphrase: 'true'
)");

  auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.broker().password() == "1234");
  assert(config.c4gh().passphrase() == "true");
}

void TestUnknownFieldsAreRejected() {
  const auto yaml_path = WriteYaml("unknown_field", R"(broker:
  host: mq
  server_name: mq
)");

  assert(Throws([&] { (void)ConfigLoader::LoadFromYaml(yaml_path.string()); }) && "ConfigLoader must reject unknown fields.");
}

void TestEnvironmentOverridesSecrets() {
  auto config = ConfigLoader::LoadFromYaml(WriteYaml("env", kSyncYaml).string());

  ::setenv("SDA_BROKER_PASSWORD", "from-env", 1);
  ::setenv("C4GH_PASSPHRASE", "secret-phrase", 1);
  ConfigLoader::ApplyEnvironmentOverrides(config);
  ::unsetenv("SDA_BROKER_PASSWORD");
  ::unsetenv("C4GH_PASSPHRASE");

  assert(config.broker().password() == "from-env");
  assert(config.c4gh().passphrase() == "secret-phrase");
  assert(config.database().has_sqlite());
}

void TestValidateNamesMissingSettings() {
  auto config = ConfigLoader::LoadFromYaml(WriteYaml("missing", kSyncYaml).string());

  // sync needs a backup, verify needs a key
  assert(Throws([&] { ConfigLoader::Validate(config, WorkerKind::kVerify); }));

  auto no_backup = config;
  no_backup.clear_backup();
  bool named = false;
  try {
    ConfigLoader::Validate(no_backup, WorkerKind::kSync);
  } catch (const std::runtime_error& e) {
    named = std::string(e.what()).find("backup") != std::string::npos;
  }
  assert(named);

  auto no_bucket = config;
  no_bucket.mutable_backup()->mutable_s3()->clear_bucket();
  assert(Throws([&] { ConfigLoader::Validate(no_bucket, WorkerKind::kSync); }));

  auto verify = config;
  verify.mutable_c4gh()->set_key_path("/keys/c4gh.sec.pem");
  ConfigLoader::Validate(verify, WorkerKind::kVerify);
}

} // namespace

int main() {
  TestSyncConfigLoads();
  TestQuotedScalarsKeepStringType();
  TestUnknownFieldsAreRejected();
  TestEnvironmentOverridesSecrets();
  TestValidateNamesMissingSettings();

  std::cout << "sda_unit_config_loader: pass\n";
  return 0;
}
