#pragma once

#include <condition_variable>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/mq/broker.hpp"

namespace sda::mq::memory {

/*
  In-process broker.

  Deliveries are served in push order; a requeueing nack puts the
  message back at the head of the queue. Every ack, nack and publish is
  recorded for inspection.
*/
class MemoryBroker final : public Broker {
 public:
  struct Published {
    std::string correlation_id;
    std::string exchange;
    std::string routing_key;
    bool        durable = false;
    std::string body;
  };

  struct Nacked {
    uint64_t tag     = 0;
    bool     requeue = false;
  };

  // Returns the delivery tag the message will carry.
  uint64_t Push(std::string body, std::string correlation_id = {});

  std::optional<Delivery> NextDelivery() override;
  void Publish(const std::string& correlation_id, const std::string& exchange, const std::string& routing_key, bool durable,
               const std::string& body) override;
  void Ack(uint64_t delivery_tag) override;
  void Nack(uint64_t delivery_tag, bool requeue) override;

  std::optional<std::string> WaitForConnectionLoss() override;
  void                       Close() override;

  // Failure injection.
  void FailPublishes(bool fail);
  void FailAcks(bool fail);
  void DropConnection(const std::string& reason);

  std::vector<uint64_t>  Acks() const;
  std::vector<Nacked>    Nacks() const;
  std::vector<Published> Publishes() const;
  std::size_t            Pending() const;

 private:
  struct Message {
    uint64_t    tag = 0;
    std::string body;
    std::string correlation_id;
  };

  mutable std::mutex      mutex_;
  std::condition_variable cv_;

  std::deque<Message>                    queue_;
  std::unordered_map<uint64_t, Message> in_flight_;
  uint64_t                               next_tag_ = 1;

  std::vector<uint64_t>  acks_;
  std::vector<Nacked>    nacks_;
  std::vector<Published> publishes_;

  bool                       fail_publishes_ = false;
  bool                       fail_acks_      = false;
  bool                       closed_         = false;
  std::optional<std::string> lost_;
};

} // namespace sda::mq::memory
