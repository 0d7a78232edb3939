#include "storage_backend.hpp"

namespace sda::storage {

int64_t StorageBackend::GetFileSize(const std::string& path) const {
  return std::visit([&](const auto& backend) { return backend.GetFileSize(path); }, impl_);
}

std::shared_ptr<arrow::io::InputStream> StorageBackend::NewFileReader(const std::string& path) const {
  return std::visit([&](const auto& backend) { return backend.NewFileReader(path); }, impl_);
}

std::shared_ptr<arrow::io::OutputStream> StorageBackend::NewFileWriter(const std::string& path) const {
  return std::visit([&](const auto& backend) { return backend.NewFileWriter(path); }, impl_);
}

std::string_view StorageBackend::Kind() const {
  return std::holds_alternative<posix::PosixBackend>(impl_) ? "posix" : "s3";
}

} // namespace sda::storage
