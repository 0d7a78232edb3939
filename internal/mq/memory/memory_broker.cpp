#include "memory_broker.hpp"

#include "internal/util/errors.hpp"

namespace sda::mq::memory {

uint64_t MemoryBroker::Push(std::string body, std::string correlation_id) {
  std::lock_guard lock(mutex_);
  const auto      tag = next_tag_++;
  queue_.push_back(Message{tag, std::move(body), std::move(correlation_id)});
  cv_.notify_all();
  return tag;
}

/*
  Closed or lost brokers still hand out what is queued, then return nullopt.
*/
std::optional<Delivery> MemoryBroker::NextDelivery() {
  std::unique_lock lock(mutex_);
  cv_.wait(lock, [&] { return !queue_.empty() || closed_ || lost_.has_value(); });
  if (queue_.empty()) return std::nullopt;

  auto message = std::move(queue_.front());
  queue_.pop_front();
  in_flight_[message.tag] = message;
  return Delivery(this, message.tag, std::move(message.body), std::move(message.correlation_id));
}

void MemoryBroker::Publish(const std::string& correlation_id, const std::string& exchange, const std::string& routing_key, bool durable,
                           const std::string& body) {
  std::lock_guard lock(mutex_);
  if (fail_publishes_) throw util::PublishError("publish rejected");
  if (lost_) throw util::PublishError("connection lost: " + *lost_);
  publishes_.push_back(Published{correlation_id, exchange, routing_key, durable, body});
}

void MemoryBroker::Ack(uint64_t delivery_tag) {
  std::lock_guard lock(mutex_);
  if (fail_acks_) throw util::TransientIOError("ack rejected");
  if (in_flight_.erase(delivery_tag) == 0) throw util::InvalidState("unknown delivery tag " + std::to_string(delivery_tag));
  acks_.push_back(delivery_tag);
}

void MemoryBroker::Nack(uint64_t delivery_tag, bool requeue) {
  std::lock_guard lock(mutex_);
  auto            it = in_flight_.find(delivery_tag);
  if (it == in_flight_.end()) throw util::InvalidState("unknown delivery tag " + std::to_string(delivery_tag));

  nacks_.push_back(Nacked{delivery_tag, requeue});
  if (requeue) {
    // Redelivered under a fresh tag, as a real broker does.
    auto message = std::move(it->second);
    message.tag  = next_tag_++;
    queue_.push_front(std::move(message));
    cv_.notify_all();
  }
  in_flight_.erase(it);
}

std::optional<std::string> MemoryBroker::WaitForConnectionLoss() {
  std::unique_lock lock(mutex_);
  cv_.wait(lock, [&] { return closed_ || lost_.has_value(); });
  return lost_;
}

void MemoryBroker::Close() {
  std::lock_guard lock(mutex_);
  closed_ = true;
  cv_.notify_all();
}

void MemoryBroker::FailPublishes(bool fail) {
  std::lock_guard lock(mutex_);
  fail_publishes_ = fail;
}

void MemoryBroker::FailAcks(bool fail) {
  std::lock_guard lock(mutex_);
  fail_acks_ = fail;
}

void MemoryBroker::DropConnection(const std::string& reason) {
  std::lock_guard lock(mutex_);
  lost_ = reason;
  cv_.notify_all();
}

std::vector<uint64_t> MemoryBroker::Acks() const {
  std::lock_guard lock(mutex_);
  return acks_;
}

std::vector<MemoryBroker::Nacked> MemoryBroker::Nacks() const {
  std::lock_guard lock(mutex_);
  return nacks_;
}

std::vector<MemoryBroker::Published> MemoryBroker::Publishes() const {
  std::lock_guard lock(mutex_);
  return publishes_;
}

std::size_t MemoryBroker::Pending() const {
  std::lock_guard lock(mutex_);
  return queue_.size();
}

} // namespace sda::mq::memory
