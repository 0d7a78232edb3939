#include "internal/storage/s3/pipe_output_stream.hpp"

#include <arrow/status.h>

#include <cassert>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace {

using sda::storage::s3::PipeOptions;
using sda::storage::s3::PipeOutputStream;

// Records every write; optionally fails from the n-th write on.
class RecordingSink final : public arrow::io::OutputStream {
 public:
  explicit RecordingSink(int fail_at_write = -1) : fail_at_write_(fail_at_write) {
  }

  arrow::Status Write(const void* data, int64_t nbytes) override {
    std::lock_guard lock(mutex_);
    if (fail_at_write_ >= 0 && static_cast<int>(writes_.size()) >= fail_at_write_) {
      return arrow::Status::IOError("injected sink failure");
    }
    writes_.emplace_back(static_cast<const char*>(data), static_cast<size_t>(nbytes));
    return arrow::Status::OK();
  }

  arrow::Status Close() override {
    std::lock_guard lock(mutex_);
    closed_ = true;
    return arrow::Status::OK();
  }

  arrow::Status Abort() override {
    std::lock_guard lock(mutex_);
    aborted_ = true;
    return arrow::Status::OK();
  }

  bool closed() const override {
    std::lock_guard lock(mutex_);
    return closed_ || aborted_;
  }

  arrow::Result<int64_t> Tell() const override {
    std::lock_guard lock(mutex_);
    int64_t n = 0;
    for (const auto& w : writes_) n += static_cast<int64_t>(w.size());
    return n;
  }

  std::vector<std::string> Writes() const {
    std::lock_guard lock(mutex_);
    return writes_;
  }

  bool Committed() const {
    std::lock_guard lock(mutex_);
    return closed_;
  }

  bool Aborted() const {
    std::lock_guard lock(mutex_);
    return aborted_;
  }

 private:
  const int                fail_at_write_;
  mutable std::mutex       mutex_;
  std::vector<std::string> writes_;
  bool                     closed_  = false;
  bool                     aborted_ = false;
};

PipeOutputStream::SinkOpener OpenerFor(const std::shared_ptr<RecordingSink>& sink) {
  return [sink]() -> arrow::Result<std::shared_ptr<arrow::io::OutputStream>> { return sink; };
}

void TestChunksAreCutAtChunkSize() {
  auto             sink = std::make_shared<RecordingSink>();
  PipeOutputStream pipe(OpenerFor(sink), PipeOptions{4, 1});

  const std::string data = "abcdefghij";
  assert(pipe.Write(data.data(), 3).ok());
  assert(pipe.Write(data.data() + 3, 7).ok());
  assert(*pipe.Tell() == 10);
  assert(pipe.Close().ok());

  const auto writes = sink->Writes();
  assert(writes.size() == 3);
  assert(writes[0] == "abcd");
  assert(writes[1] == "efgh");
  assert(writes[2] == "ij");
  assert(sink->Committed());
  assert(pipe.closed());
}

void TestEmptyUploadStillCommits() {
  auto             sink = std::make_shared<RecordingSink>();
  PipeOutputStream pipe(OpenerFor(sink), PipeOptions{});

  assert(pipe.Close().ok());
  assert(sink->Writes().empty());
  assert(sink->Committed());
}

void TestSinkFailureSurfacesOnWriteOrClose() {
  auto             sink = std::make_shared<RecordingSink>(1);
  PipeOutputStream pipe(OpenerFor(sink), PipeOptions{2, 1});

  const std::string data(64, 'z');
  arrow::Status     status;
  for (int i = 0; i < 32 && status.ok(); ++i) {
    status = pipe.Write(data.data(), 2);
  }
  if (status.ok()) status = pipe.Close();

  assert(status.IsIOError());
  assert(status.message().find("injected") != std::string::npos);
  assert(sink->Aborted());
  assert(!sink->Committed());
}

void TestOpenFailureIsReported() {
  PipeOutputStream pipe([]() -> arrow::Result<std::shared_ptr<arrow::io::OutputStream>> { return arrow::Status::IOError("no bucket"); },
                        PipeOptions{8, 1});

  // the write may race the failed open; close must report it either way
  (void)pipe.Write("x", 1);
  auto status = pipe.Close();
  assert(!status.ok());
  assert(status.message().find("no bucket") != std::string::npos);
}

void TestAbortDropsUpload() {
  auto sink = std::make_shared<RecordingSink>();
  {
    PipeOutputStream pipe(OpenerFor(sink), PipeOptions{1024, 2});
    assert(pipe.Write("partial", 7).ok());
    assert(pipe.Abort().ok());
    assert(pipe.Abort().ok());
    assert(!pipe.Write("more", 4).ok());
  }
  assert(!sink->Committed());
}

} // namespace

int main() {
  TestChunksAreCutAtChunkSize();
  TestEmptyUploadStillCommits();
  TestSinkFailureSurfacesOnWriteOrClose();
  TestOpenFailureIsReported();
  TestAbortDropsUpload();

  std::cout << "sda_unit_pipe_output_stream: pass\n";
  return 0;
}
