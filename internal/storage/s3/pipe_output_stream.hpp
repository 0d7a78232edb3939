#pragma once

#include <arrow/io/interfaces.h>
#include <arrow/result.h>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "chunk_channel.hpp"

namespace sda::storage::s3 {

struct PipeOptions {
  // bytes handed to the uploader per chunk
  int64_t chunk_size = 5 * 1024 * 1024;
  // chunks buffered between caller and uploader
  std::size_t capacity = 2;
};

/*
  In-process pipe in front of a streaming uploader.

  Bytes written by the caller are cut into chunks and pushed through a
  bounded ChunkChannel to a background thread, which opens the sink
  (the multipart upload) and writes the chunks into it as they arrive.

  The first sink error is latched; the caller sees it on its next
  Write() or on Close(). Close() signals end-of-input and joins the
  background thread: the upload is complete once Close() returns OK.
*/
class PipeOutputStream final : public arrow::io::OutputStream {
 public:
  using SinkOpener = std::function<arrow::Result<std::shared_ptr<arrow::io::OutputStream>>()>;

  PipeOutputStream(SinkOpener open_sink, PipeOptions options);
  ~PipeOutputStream() override;

  PipeOutputStream(const PipeOutputStream&)            = delete;
  PipeOutputStream& operator=(const PipeOutputStream&) = delete;

  arrow::Status Close() override;
  arrow::Status Abort() override;
  bool          closed() const override;

  arrow::Result<int64_t> Tell() const override;

  using arrow::io::OutputStream::Write;
  arrow::Status Write(const void* data, int64_t nbytes) override;

 private:
  void          Upload(SinkOpener open_sink);
  void          Fail(const arrow::Status& status);
  arrow::Status UploadStatus() const;
  arrow::Status PushPending();

  const PipeOptions options_;
  ChunkChannel      channel_;

  std::string pending_;
  int64_t     position_ = 0;
  bool        closed_   = false;
  bool        aborted_  = false;

  mutable std::mutex upload_mutex_;
  arrow::Status      upload_status_;

  std::thread uploader_;
};

} // namespace sda::storage::s3
