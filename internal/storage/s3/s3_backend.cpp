#include "s3_backend.hpp"

#include <arrow/filesystem/s3fs.h>
#include <arrow/io/interfaces.h>
#include <arrow/util/key_value_metadata.h>

#include "internal/observability/logging.hpp"
#include "internal/storage/common/arrow_utils.hpp"
#include "internal/util/errors.hpp"
#include "s3_tls.hpp"

namespace sda::storage::s3 {

using namespace sda::storage::common;

S3Backend::S3Backend(std::shared_ptr<arrow::fs::FileSystem> fs, std::string bucket, PipeOptions pipe_options)
    : fs_(std::move(fs)), bucket_(std::move(bucket)), pipe_options_(pipe_options) {
  if (bucket_.empty()) {
    throw std::invalid_argument("s3 bucket must not be empty");
  }
}

/*
  Object key layout:

      <bucket>/<path>
*/
std::string S3Backend::ObjectPath(const std::string& path) const {
  std::size_t start = 0;
  while (start < path.size() && path[start] == '/') ++start;
  if (start == path.size()) {
    throw util::InvalidPath("empty object key");
  }
  return bucket_ + "/" + path.substr(start);
}

int64_t S3Backend::GetFileSize(const std::string& path) const {
  auto info = Unwrap(fs_->GetFileInfo(ObjectPath(path)));
  if (info.type() == arrow::fs::FileType::NotFound) {
    throw util::NotFound("no such object: " + path);
  }
  return info.size();
}

std::shared_ptr<arrow::io::InputStream> S3Backend::NewFileReader(const std::string& path) const {
  auto info = Unwrap(fs_->GetFileInfo(ObjectPath(path)));
  if (info.type() == arrow::fs::FileType::NotFound) {
    throw util::NotFound("no such object: " + path);
  }
  return Unwrap(fs_->OpenInputStream(info));
}

std::shared_ptr<arrow::io::OutputStream> S3Backend::NewFileWriter(const std::string& path) const {
  auto fs          = fs_;
  auto object_path = ObjectPath(path);

  return std::make_shared<PipeOutputStream>(
      [fs, object_path]() {
        auto metadata = arrow::key_value_metadata({"Content-Type"}, {"application/octet-stream"});
        return fs->OpenOutputStream(object_path, metadata);
      },
      pipe_options_);
}

arrow::fs::S3Options S3OptionsFromConfig(const sda::runtime::config::S3StorageConfig& config) {
  std::string host   = config.url();
  std::string scheme = "https";
  if (host.rfind("http://", 0) == 0) {
    scheme = "http";
    host   = host.substr(7);
    SDA_LOG_WARN("s3 endpoint configured without TLS", {observability::StringField("url", config.url())});
  } else if (host.rfind("https://", 0) == 0) {
    host = host.substr(8);
  }
  while (!host.empty() && host.back() == '/') host.pop_back();

  auto options = arrow::fs::S3Options::FromAccessKey(config.access_key(), config.secret_key());
  options.region                   = config.region().empty() ? "us-east-1" : config.region();
  options.scheme                   = scheme;
  options.endpoint_override        = config.port() == 0 ? host : host + ":" + std::to_string(config.port());
  options.force_virtual_addressing = false;
  options.background_writes        = true;
  options.allow_bucket_creation    = false;
  options.allow_bucket_deletion    = false;

  if (scheme == "https") {
    CheckTlsFloor();
    options.tls_verify_certificates = true;
    options.tls_ca_file_path        = BuildCaBundle(config.cacert());
  }
  return options;
}

int ApplyUploadConcurrency(const sda::runtime::config::S3StorageConfig& config) {
  const int current = arrow::io::GetIOThreadPoolCapacity();
  const int wanted  = static_cast<int>(config.upload_concurrency());
  if (wanted <= current) return current;

  Unwrap(arrow::io::SetIOThreadPoolCapacity(wanted));
  SDA_LOG_INFO("s3 upload concurrency", {observability::IntField("io_threads", wanted)});
  return wanted;
}

std::shared_ptr<arrow::fs::FileSystem> MakeS3FileSystem(const sda::runtime::config::S3StorageConfig& config) {
  Unwrap(arrow::fs::EnsureS3Initialized());
  ApplyUploadConcurrency(config);
  return Unwrap(arrow::fs::S3FileSystem::Make(S3OptionsFromConfig(config)));
}

PipeOptions PipeOptionsFromConfig(const sda::runtime::config::S3StorageConfig& config) {
  PipeOptions options;
  if (config.chunk_size() > 0) {
    options.chunk_size = static_cast<int64_t>(config.chunk_size());
  }
  if (config.upload_concurrency() > 0) {
    options.capacity = config.upload_concurrency();
  }
  return options;
}

} // namespace sda::storage::s3
