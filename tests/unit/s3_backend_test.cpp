#include "internal/storage/s3/s3_backend.hpp"

#include <arrow/filesystem/mockfs.h>
#include <arrow/filesystem/s3fs.h>
#include <arrow/io/interfaces.h>

#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>

#include "internal/factory.hpp"
#include "internal/storage/common/arrow_utils.hpp"
#include "internal/storage/s3/s3_tls.hpp"
#include "internal/util/errors.hpp"
#include "tests/unit/support/fixtures.hpp"

namespace {

using sda::storage::common::Unwrap;
using sda::storage::s3::PipeOptions;
using sda::storage::s3::S3Backend;

template <typename E, typename Fn>
bool Throws(Fn&& fn) {
  try {
    fn();
  } catch (const E&) {
    return true;
  }
  return false;
}

std::shared_ptr<arrow::fs::internal::MockFileSystem> MakeBucket() {
  auto fs = std::make_shared<arrow::fs::internal::MockFileSystem>(std::chrono::system_clock::now());
  Unwrap(fs->CreateDir("backup/2024", true));
  return fs;
}

void TestUploadThenRead() {
  auto      fs = MakeBucket();
  S3Backend backend(fs, "backup", PipeOptions{100, 2});

  const std::string payload(1024, 'b');
  auto              out = backend.NewFileWriter("/2024/a1b2c3");
  Unwrap(out->Write(payload.data(), 1000));
  Unwrap(out->Write(payload.data() + 1000, 24));
  Unwrap(out->Close());

  assert(backend.GetFileSize("2024/a1b2c3") == 1024);

  auto in   = backend.NewFileReader("2024/a1b2c3");
  auto read = Unwrap(in->Read(4096));
  assert(read->ToString() == payload);
  Unwrap(in->Close());

  // stored under <bucket>/<key>
  auto info = Unwrap(fs->GetFileInfo("backup/2024/a1b2c3"));
  assert(info.IsFile());
}

void TestAbortedUploadIsNotVisible() {
  auto      fs = MakeBucket();
  S3Backend backend(fs, "backup", PipeOptions{});

  auto out = backend.NewFileWriter("2024/dropped");
  Unwrap(out->Write("partial", 7));
  Unwrap(out->Abort());

  // the partial bytes never become an object
  int64_t size = -1;
  try {
    size = backend.GetFileSize("2024/dropped");
  } catch (const sda::util::NotFound&) {
  }
  assert(size != 7);
}

void TestMissingObjectsAndKeys() {
  auto      fs = MakeBucket();
  S3Backend backend(fs, "backup", PipeOptions{});

  assert(Throws<sda::util::NotFound>([&] { backend.GetFileSize("2024/none"); }));
  assert(Throws<sda::util::NotFound>([&] { backend.NewFileReader("2024/none"); }));
  assert(Throws<sda::util::InvalidPath>([&] { backend.GetFileSize("///"); }));
  assert(Throws<std::invalid_argument>([&] { S3Backend unnamed(fs, "", PipeOptions{}); }));
}

void TestUploadIntoMissingBucketFailsOnClose() {
  auto      fs = std::make_shared<arrow::fs::internal::MockFileSystem>(std::chrono::system_clock::now());
  S3Backend backend(fs, "nobucket", PipeOptions{});

  auto out = backend.NewFileWriter("file");
  (void)out->Write("x", 1);
  assert(!out->Close().ok());
}

void TestPipeOptionsFromConfig() {
  sda::runtime::config::S3StorageConfig config;
  auto                                  options = sda::storage::s3::PipeOptionsFromConfig(config);
  assert(options.chunk_size == PipeOptions{}.chunk_size);
  assert(options.capacity == PipeOptions{}.capacity);

  config.set_chunk_size(8 << 20);
  config.set_upload_concurrency(4);
  options = sda::storage::s3::PipeOptionsFromConfig(config);
  assert(options.chunk_size == (8 << 20));
  assert(options.capacity == 4);
}

void TestCaBundle() {
  assert(sda::storage::s3::BuildCaBundle("").empty());
  assert(Throws<std::runtime_error>([] { sda::storage::s3::BuildCaBundle("/nonexistent/ca.pem"); }));
}

void TestS3OptionsFromConfig() {
  Unwrap(arrow::fs::EnsureS3Initialized());
  sda::storage::s3::CheckTlsFloor();

  sda::runtime::config::S3StorageConfig config;
  config.set_url("https://s3.example.org/");
  config.set_port(9000);
  config.set_access_key("access");
  config.set_secret_key("secret");

  auto options = sda::storage::s3::S3OptionsFromConfig(config);
  assert(options.scheme == "https");
  assert(options.endpoint_override == "s3.example.org:9000");
  assert(options.region == "us-east-1");
  assert(options.tls_verify_certificates);
  assert(options.tls_ca_file_path.empty());
  assert(!options.force_virtual_addressing);
  assert(!options.allow_bucket_creation && !options.allow_bucket_deletion);

  // no scheme still means TLS
  config.set_url("objects.example.org");
  config.set_port(0);
  config.set_region("eu-north-1");
  options = sda::storage::s3::S3OptionsFromConfig(config);
  assert(options.scheme == "https");
  assert(options.endpoint_override == "objects.example.org");
  assert(options.region == "eu-north-1");

  config.set_url("http://minio:9000");
  options = sda::storage::s3::S3OptionsFromConfig(config);
  assert(options.scheme == "http");
  assert(options.endpoint_override == "minio:9000");
}

void TestUploadConcurrencyRaisesIoPool() {
  sda::runtime::config::S3StorageConfig config;
  const int                             before = arrow::io::GetIOThreadPoolCapacity();
  assert(sda::storage::s3::ApplyUploadConcurrency(config) == before);

  config.set_upload_concurrency(static_cast<uint32_t>(before + 4));
  assert(sda::storage::s3::ApplyUploadConcurrency(config) == before + 4);
  assert(arrow::io::GetIOThreadPoolCapacity() == before + 4);

  // never lowered
  config.set_upload_concurrency(1);
  assert(sda::storage::s3::ApplyUploadConcurrency(config) == before + 4);
}

void TestCaBundleRemovedAtShutdown() {
  const auto ca     = sda::testing::ReadFixture("tls/ca.pem");
  const auto bundle = sda::storage::s3::BuildCaBundle(sda::testing::FixturePath("tls/ca.pem"));
  assert(!bundle.empty());
  assert(std::filesystem::exists(bundle));
  {
    std::ifstream in(bundle, std::ios::binary);
    const std::string text((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    assert(text.find(ca) != std::string::npos);
  }

  sda::runtime::config::RuntimeConfig config;
  config.mutable_archive()->mutable_s3()->set_url("https://s3.example.org");
  sda::factory::Shutdown(config);

  assert(!std::filesystem::exists(bundle));
  assert(sda::storage::s3::RemoveCaBundles() == 0);
}

} // namespace

int main() {
  TestUploadThenRead();
  TestAbortedUploadIsNotVisible();
  TestMissingObjectsAndKeys();
  TestUploadIntoMissingBucketFailsOnClose();
  TestPipeOptionsFromConfig();
  TestCaBundle();
  TestS3OptionsFromConfig();
  TestUploadConcurrencyRaisesIoPool();
  // finalizes S3, keep last
  TestCaBundleRemovedAtShutdown();

  std::cout << "sda_unit_s3_backend: pass\n";
  return 0;
}
