#include "chunk_channel.hpp"

namespace sda::storage::s3 {

ChunkChannel::ChunkChannel(std::size_t capacity) : capacity_(capacity == 0 ? 1 : capacity) {
}

bool ChunkChannel::Push(std::shared_ptr<arrow::Buffer> chunk) {
  {
    std::unique_lock lock(mutex_);
    not_full_.wait(lock, [&] { return cancelled_ || queue_.size() < capacity_; });
    if (cancelled_ || input_closed_) return false;
    queue_.push_back(std::move(chunk));
  }
  not_empty_.notify_one();
  return true;
}

std::shared_ptr<arrow::Buffer> ChunkChannel::Pop() {
  std::shared_ptr<arrow::Buffer> chunk;
  {
    std::unique_lock lock(mutex_);
    not_empty_.wait(lock, [&] { return cancelled_ || input_closed_ || !queue_.empty(); });

    if (cancelled_ || queue_.empty()) return nullptr;

    chunk = std::move(queue_.front());
    queue_.pop_front();
  }
  not_full_.notify_one();
  return chunk;
}

void ChunkChannel::CloseInput() {
  {
    std::lock_guard lock(mutex_);
    input_closed_ = true;
  }
  not_empty_.notify_all();
}

void ChunkChannel::Cancel() {
  {
    std::lock_guard lock(mutex_);
    cancelled_ = true;
    queue_.clear();
  }
  not_empty_.notify_all();
  not_full_.notify_all();
}

bool ChunkChannel::Cancelled() const {
  std::lock_guard lock(mutex_);
  return cancelled_;
}

} // namespace sda::storage::s3
