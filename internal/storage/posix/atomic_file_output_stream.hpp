#pragma once

#include <arrow/io/file.h>
#include <arrow/io/interfaces.h>
#include <arrow/result.h>

#include <filesystem>
#include <memory>

namespace sda::storage::posix {

/*
  Output stream with atomic replace semantics:

      write <path>.part → Close(): flush, close, rename onto <path>
                          Abort(): close, unlink <path>.part

  Readers never observe a partially written file.
*/
class AtomicFileOutputStream final : public arrow::io::OutputStream {
 public:
  static arrow::Result<std::shared_ptr<AtomicFileOutputStream>> Open(std::filesystem::path final_path);

  ~AtomicFileOutputStream() override;

  arrow::Status Close() override;
  arrow::Status Abort() override;
  bool          closed() const override;

  arrow::Result<int64_t> Tell() const override;

  using arrow::io::OutputStream::Write;
  arrow::Status Write(const void* data, int64_t nbytes) override;
  arrow::Status Flush() override;

 private:
  AtomicFileOutputStream(std::filesystem::path final_path, std::filesystem::path part_path,
                         std::shared_ptr<arrow::io::FileOutputStream> out);

  std::filesystem::path                        final_path_;
  std::filesystem::path                        part_path_;
  std::shared_ptr<arrow::io::FileOutputStream> out_;
  bool                                         finished_ = false;
};

} // namespace sda::storage::posix
