#pragma once

#include <arrow/buffer.h>

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>

namespace sda::storage::s3 {

/*
  Bounded blocking queue of byte chunks between a writer and the
  background upload task.

  Producer side:  Push() blocks while full, CloseInput() marks end-of-input.
  Consumer side:  Pop() blocks while empty, returns nullptr at end-of-input.
  Either side:    Cancel() wakes everyone; further Push() fails, Pop() drains to nullptr.
*/
class ChunkChannel {
 public:
  explicit ChunkChannel(std::size_t capacity);

  // false if the channel was cancelled
  bool Push(std::shared_ptr<arrow::Buffer> chunk);

  std::shared_ptr<arrow::Buffer> Pop();

  void CloseInput();
  void Cancel();

  bool Cancelled() const;

 private:
  const std::size_t capacity_;

  mutable std::mutex                         mutex_;
  std::condition_variable                    not_full_;
  std::condition_variable                    not_empty_;
  std::deque<std::shared_ptr<arrow::Buffer>> queue_;
  bool                                       input_closed_ = false;
  bool                                       cancelled_    = false;
};

} // namespace sda::storage::s3
