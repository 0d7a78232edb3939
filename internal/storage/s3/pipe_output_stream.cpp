#include "pipe_output_stream.hpp"

#include <arrow/buffer.h>

#include <algorithm>

namespace sda::storage::s3 {
namespace {

PipeOptions Normalize(PipeOptions options) {
  if (options.chunk_size <= 0) options.chunk_size = PipeOptions{}.chunk_size;
  if (options.capacity == 0) options.capacity = 1;
  return options;
}

} // namespace

PipeOutputStream::PipeOutputStream(SinkOpener open_sink, PipeOptions options)
    : options_(Normalize(options)), channel_(options_.capacity) {
  pending_.reserve(static_cast<std::size_t>(options_.chunk_size));
  uploader_ = std::thread(&PipeOutputStream::Upload, this, std::move(open_sink));
}

PipeOutputStream::~PipeOutputStream() {
  if (!closed_) {
    ARROW_UNUSED(Abort());
  }
}

/*
  Background task: open sink, drain channel, finalize.
*/
void PipeOutputStream::Upload(SinkOpener open_sink) {
  auto maybe_sink = open_sink();
  if (!maybe_sink.ok()) {
    Fail(maybe_sink.status());
    return;
  }
  auto sink = *maybe_sink;

  while (auto chunk = channel_.Pop()) {
    auto status = sink->Write(chunk);
    if (!status.ok()) {
      ARROW_UNUSED(sink->Abort());
      Fail(status);
      return;
    }
  }

  if (channel_.Cancelled()) {
    ARROW_UNUSED(sink->Abort());
    return;
  }

  auto status = sink->Close();
  if (!status.ok()) {
    Fail(status);
  }
}

void PipeOutputStream::Fail(const arrow::Status& status) {
  {
    std::lock_guard lock(upload_mutex_);
    if (upload_status_.ok()) {
      upload_status_ = status;
    }
  }
  // unblock a writer waiting on a full channel
  channel_.Cancel();
}

arrow::Status PipeOutputStream::UploadStatus() const {
  std::lock_guard lock(upload_mutex_);
  return upload_status_;
}

arrow::Status PipeOutputStream::PushPending() {
  if (pending_.empty()) return arrow::Status::OK();

  auto chunk = arrow::Buffer::FromString(std::move(pending_));
  pending_   = std::string();
  pending_.reserve(static_cast<std::size_t>(options_.chunk_size));

  if (!channel_.Push(std::move(chunk))) {
    auto status = UploadStatus();
    return status.ok() ? arrow::Status::IOError("upload pipe closed") : status;
  }
  return arrow::Status::OK();
}

arrow::Status PipeOutputStream::Write(const void* data, int64_t nbytes) {
  if (closed_) return arrow::Status::Invalid("write to closed pipe");
  ARROW_RETURN_NOT_OK(UploadStatus());

  const auto* bytes     = static_cast<const char*>(data);
  int64_t     remaining = nbytes;
  while (remaining > 0) {
    const auto room = options_.chunk_size - static_cast<int64_t>(pending_.size());
    const auto n    = std::min(room, remaining);
    pending_.append(bytes, static_cast<std::size_t>(n));
    bytes += n;
    remaining -= n;

    if (static_cast<int64_t>(pending_.size()) >= options_.chunk_size) {
      ARROW_RETURN_NOT_OK(PushPending());
    }
  }

  position_ += nbytes;
  return arrow::Status::OK();
}

arrow::Status PipeOutputStream::Close() {
  if (closed_) return aborted_ ? arrow::Status::OK() : UploadStatus();
  closed_ = true;

  auto status = PushPending();
  channel_.CloseInput();
  if (uploader_.joinable()) uploader_.join();

  ARROW_RETURN_NOT_OK(UploadStatus());
  return status;
}

arrow::Status PipeOutputStream::Abort() {
  if (closed_) return arrow::Status::OK();
  closed_  = true;
  aborted_ = true;

  pending_.clear();
  channel_.Cancel();
  if (uploader_.joinable()) uploader_.join();
  return arrow::Status::OK();
}

bool PipeOutputStream::closed() const {
  return closed_;
}

arrow::Result<int64_t> PipeOutputStream::Tell() const {
  return position_;
}

} // namespace sda::storage::s3
