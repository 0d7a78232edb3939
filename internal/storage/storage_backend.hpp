#pragma once

#include <arrow/io/interfaces.h>

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <variant>

#include "posix/posix_backend.hpp"
#include "s3/s3_backend.hpp"

namespace sda::storage {

/*
  Storage abstraction.

  Capability set: size / read / write. The concrete backend is chosen
  once, at construction, from configuration:

    POSIX  → directory tree under a root
    S3     → S3-compatible object store (MinIO, Ceph, AWS)

  Both are streaming: nothing here holds a whole file in memory.
*/
class StorageBackend {
 public:
  using Impl = std::variant<posix::PosixBackend, s3::S3Backend>;

  explicit StorageBackend(Impl impl) : impl_(std::move(impl)) {
  }

  // Throws NotFound when the path does not exist.
  int64_t GetFileSize(const std::string& path) const;

  // Caller closes the stream on every exit path.
  std::shared_ptr<arrow::io::InputStream> NewFileReader(const std::string& path) const;

  /*
    Close() finalizes the file (rename / multipart complete) and
    returns the write outcome. Abort() discards it.
  */
  std::shared_ptr<arrow::io::OutputStream> NewFileWriter(const std::string& path) const;

  std::string_view Kind() const;

 private:
  Impl impl_;
};

using StorageBackendPtr = std::shared_ptr<StorageBackend>;

} // namespace sda::storage
