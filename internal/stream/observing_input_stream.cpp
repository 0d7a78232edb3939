#include "observing_input_stream.hpp"

#include <arrow/buffer.h>

namespace sda::stream {

ObservingInputStream::ObservingInputStream(std::shared_ptr<arrow::io::InputStream> inner, std::vector<Observer> observers)
    : inner_(std::move(inner)), observers_(std::move(observers)) {
}

arrow::Status ObservingInputStream::Close() {
  return inner_->Close();
}

arrow::Status ObservingInputStream::Abort() {
  return inner_->Abort();
}

bool ObservingInputStream::closed() const {
  return inner_->closed();
}

arrow::Result<int64_t> ObservingInputStream::Tell() const {
  return inner_->Tell();
}

arrow::Result<int64_t> ObservingInputStream::Read(int64_t nbytes, void* out) {
  ARROW_ASSIGN_OR_RAISE(auto n, inner_->Read(nbytes, out));
  Notify(static_cast<const uint8_t*>(out), n);
  return n;
}

arrow::Result<std::shared_ptr<arrow::Buffer>> ObservingInputStream::Read(int64_t nbytes) {
  ARROW_ASSIGN_OR_RAISE(auto buffer, inner_->Read(nbytes));
  Notify(buffer->data(), buffer->size());
  return buffer;
}

void ObservingInputStream::Notify(const uint8_t* data, int64_t length) {
  if (length <= 0) return;
  for (const auto& observer : observers_) {
    observer(data, length);
  }
  observed_ += length;
}

} // namespace sda::stream
