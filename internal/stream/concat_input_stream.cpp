#include "concat_input_stream.hpp"

#include <arrow/buffer.h>

namespace sda::stream {

ConcatInputStream::ConcatInputStream(std::vector<std::shared_ptr<arrow::io::InputStream>> parts) : parts_(std::move(parts)) {
}

arrow::Status ConcatInputStream::Close() {
  if (closed_) return arrow::Status::OK();
  closed_ = true;

  arrow::Status first_error;
  for (auto& part : parts_) {
    auto status = part->Close();
    if (!status.ok() && first_error.ok()) first_error = status;
  }
  return first_error;
}

bool ConcatInputStream::closed() const {
  return closed_;
}

arrow::Result<int64_t> ConcatInputStream::Tell() const {
  if (closed_) return arrow::Status::Invalid("stream is closed");
  return position_;
}

arrow::Result<int64_t> ConcatInputStream::Read(int64_t nbytes, void* out) {
  if (closed_) return arrow::Status::Invalid("stream is closed");

  auto*   dst   = static_cast<uint8_t*>(out);
  int64_t total = 0;
  while (total < nbytes && current_ < parts_.size()) {
    ARROW_ASSIGN_OR_RAISE(auto n, parts_[current_]->Read(nbytes - total, dst + total));
    if (n == 0) {
      ++current_;
      continue;
    }
    total += n;
  }
  position_ += total;
  return total;
}

arrow::Result<std::shared_ptr<arrow::Buffer>> ConcatInputStream::Read(int64_t nbytes) {
  ARROW_ASSIGN_OR_RAISE(auto buffer, arrow::AllocateResizableBuffer(nbytes));
  ARROW_ASSIGN_OR_RAISE(auto n, Read(nbytes, buffer->mutable_data()));
  ARROW_RETURN_NOT_OK(buffer->Resize(n, false));
  return std::shared_ptr<arrow::Buffer>(std::move(buffer));
}

} // namespace sda::stream
