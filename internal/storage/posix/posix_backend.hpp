#pragma once

#include <arrow/io/interfaces.h>

#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>

namespace sda::storage::posix {

/*
  POSIX directory tree backend.

  Properties:
    - every path is confined under root
    - atomic replace writes (see AtomicFileOutputStream)
    - parent directories created on write
*/
class PosixBackend {
 public:
  explicit PosixBackend(std::filesystem::path root);

  // Throws NotFound / TransientIOError / InvalidPath.
  int64_t GetFileSize(const std::string& path) const;

  std::shared_ptr<arrow::io::InputStream> NewFileReader(const std::string& path) const;

  // Caller must Close() to publish the file, or Abort() to drop it.
  std::shared_ptr<arrow::io::OutputStream> NewFileWriter(const std::string& path) const;

  const std::filesystem::path& Root() const {
    return root_;
  }

 private:
  std::filesystem::path root_;
};

} // namespace sda::storage::posix
