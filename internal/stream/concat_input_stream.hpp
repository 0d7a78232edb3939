#pragma once

#include <arrow/io/interfaces.h>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <vector>

namespace sda::stream {

/*
  Reads its parts back to back as one logical stream.

  Parts are consumed lazily: the next part is only touched once the
  previous one returned end of stream. Close() closes every part.
*/
class ConcatInputStream final : public arrow::io::InputStream {
 public:
  explicit ConcatInputStream(std::vector<std::shared_ptr<arrow::io::InputStream>> parts);

  arrow::Status Close() override;
  bool          closed() const override;

  arrow::Result<int64_t> Tell() const override;

  arrow::Result<int64_t>                        Read(int64_t nbytes, void* out) override;
  arrow::Result<std::shared_ptr<arrow::Buffer>> Read(int64_t nbytes) override;

 private:
  std::vector<std::shared_ptr<arrow::io::InputStream>> parts_;
  std::size_t                                          current_  = 0;
  int64_t                                              position_ = 0;
  bool                                                 closed_   = false;
};

} // namespace sda::stream
