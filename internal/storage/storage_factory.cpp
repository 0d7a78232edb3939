#include "storage_factory.hpp"

#include <stdexcept>

#include "internal/observability/logging.hpp"

namespace sda::storage {

using observability::StringField;

StorageBackendPtr StorageFactory::Build(const sda::runtime::config::StorageConfig& cfg) {
  switch (cfg.backend_case()) {
    case sda::runtime::config::StorageConfig::kPosix: {
      if (cfg.posix().location().empty()) {
        throw std::invalid_argument("posix storage requires location");
      }
      SDA_LOG_INFO("storage backend", {StringField("kind", "posix"), StringField("location", cfg.posix().location())});
      return std::make_shared<StorageBackend>(posix::PosixBackend(cfg.posix().location()));
    }
    case sda::runtime::config::StorageConfig::kS3: {
      const auto& s3 = cfg.s3();
      if (s3.url().empty() || s3.bucket().empty()) {
        throw std::invalid_argument("s3 storage requires url and bucket");
      }
      SDA_LOG_INFO("storage backend", {StringField("kind", "s3"), StringField("url", s3.url()), StringField("bucket", s3.bucket())});
      return std::make_shared<StorageBackend>(
          s3::S3Backend(s3::MakeS3FileSystem(s3), s3.bucket(), s3::PipeOptionsFromConfig(s3)));
    }
    case sda::runtime::config::StorageConfig::BACKEND_NOT_SET:
      break;
  }
  throw std::invalid_argument("storage backend not configured");
}

} // namespace sda::storage
