#include "atomic_file_output_stream.hpp"

#include <system_error>

namespace sda::storage::posix {

arrow::Result<std::shared_ptr<AtomicFileOutputStream>> AtomicFileOutputStream::Open(std::filesystem::path final_path) {
  auto part_path = final_path;
  part_path += ".part";

  ARROW_ASSIGN_OR_RAISE(auto out, arrow::io::FileOutputStream::Open(part_path.string()));

  std::error_code ec;
  std::filesystem::permissions(part_path,
                               std::filesystem::perms::owner_read | std::filesystem::perms::owner_write |
                                   std::filesystem::perms::group_read,
                               ec);
  if (ec) {
    ARROW_UNUSED(out->Abort());
    std::filesystem::remove(part_path, ec);
    return arrow::Status::IOError("failed to set permissions on ", part_path.string());
  }

  return std::shared_ptr<AtomicFileOutputStream>(
      new AtomicFileOutputStream(std::move(final_path), std::move(part_path), std::move(out)));
}

AtomicFileOutputStream::AtomicFileOutputStream(std::filesystem::path final_path, std::filesystem::path part_path,
                                               std::shared_ptr<arrow::io::FileOutputStream> out)
    : final_path_(std::move(final_path)), part_path_(std::move(part_path)), out_(std::move(out)) {
}

// A writer dropped without Close() leaves no file behind.
AtomicFileOutputStream::~AtomicFileOutputStream() {
  if (!finished_) {
    ARROW_UNUSED(Abort());
  }
}

arrow::Status AtomicFileOutputStream::Close() {
  if (finished_) return arrow::Status::OK();
  finished_ = true;

  auto status = out_->Close();
  if (!status.ok()) {
    std::error_code ec;
    std::filesystem::remove(part_path_, ec);
    return status;
  }

  std::error_code ec;
  std::filesystem::rename(part_path_, final_path_, ec);
  if (ec) {
    std::filesystem::remove(part_path_, ec);
    return arrow::Status::IOError("failed to rename ", part_path_.string(), " to ", final_path_.string(), ": ",
                                  ec.message());
  }
  return arrow::Status::OK();
}

arrow::Status AtomicFileOutputStream::Abort() {
  if (finished_) return arrow::Status::OK();
  finished_ = true;

  auto status = out_->Abort();
  std::error_code ec;
  std::filesystem::remove(part_path_, ec);
  return status;
}

bool AtomicFileOutputStream::closed() const {
  return finished_;
}

arrow::Result<int64_t> AtomicFileOutputStream::Tell() const {
  return out_->Tell();
}

arrow::Status AtomicFileOutputStream::Write(const void* data, int64_t nbytes) {
  if (finished_) return arrow::Status::Invalid("write to closed stream");
  return out_->Write(data, nbytes);
}

arrow::Status AtomicFileOutputStream::Flush() {
  return out_->Flush();
}

} // namespace sda::storage::posix
