#include "posix_backend.hpp"

#include <arrow/io/file.h>

#include <system_error>

#include "atomic_file_output_stream.hpp"
#include "internal/storage/common/arrow_utils.hpp"
#include "internal/storage/common/path_utils.hpp"
#include "internal/util/errors.hpp"

namespace sda::storage::posix {

using namespace sda::storage::common;

PosixBackend::PosixBackend(std::filesystem::path root) : root_(std::move(root)) {
  std::error_code ec;
  if (!std::filesystem::is_directory(root_, ec)) {
    throw std::runtime_error("posix storage location is not a directory: " + root_.string());
  }
}

int64_t PosixBackend::GetFileSize(const std::string& path) const {
  const auto full_path = ResolveUnderRoot(root_, path);

  std::error_code ec;
  const auto      status = std::filesystem::status(full_path, ec);
  if (status.type() == std::filesystem::file_type::not_found) {
    throw util::NotFound("no such file: " + path);
  }
  if (ec) {
    throw util::TransientIOError("stat " + full_path.string() + ": " + ec.message());
  }
  if (!std::filesystem::is_regular_file(status)) {
    throw util::TransientIOError("not a regular file: " + full_path.string());
  }

  const auto size = std::filesystem::file_size(full_path, ec);
  if (ec) {
    throw util::TransientIOError("stat " + full_path.string() + ": " + ec.message());
  }
  return static_cast<int64_t>(size);
}

/*
  Open file for streaming reads.
*/
std::shared_ptr<arrow::io::InputStream> PosixBackend::NewFileReader(const std::string& path) const {
  const auto full_path = ResolveUnderRoot(root_, path);

  std::error_code ec;
  if (!std::filesystem::exists(full_path, ec)) {
    throw util::NotFound("no such file: " + path);
  }

  return Unwrap(arrow::io::ReadableFile::Open(full_path.string()));
}

std::shared_ptr<arrow::io::OutputStream> PosixBackend::NewFileWriter(const std::string& path) const {
  const auto full_path = ResolveUnderRoot(root_, path);

  std::error_code ec;
  std::filesystem::create_directories(full_path.parent_path(), ec);
  if (ec) {
    throw util::TransientIOError("create directories for " + full_path.string() + ": " + ec.message());
  }

  return Unwrap(AtomicFileOutputStream::Open(full_path));
}

} // namespace sda::storage::posix
