#pragma once

#include <rabbitmq-c/amqp.h>

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "config/config.pb.h"
#include "internal/mq/broker.hpp"

namespace sda::mq::amqp {

/*
  RabbitMQ broker over rabbitmq-c.

  One connection, one channel:
    - QoS prefetch (default 1), manual acks
    - publisher confirms unless publish_confirms is false
    - TLS 1.2+ with optional CA and client certificate

  rabbitmq-c connections are not thread safe. All AMQP traffic happens
  on the worker loop thread; the watcher thread only waits for the
  loss flag this class raises when a call observes a dead connection.
  Heartbeats are serviced while NextDelivery() polls.
*/
class AmqpBroker final : public Broker {
 public:
  // Connects and starts consuming. Throws std::runtime_error on failure.
  explicit AmqpBroker(const sda::runtime::config::BrokerConfig& config);
  ~AmqpBroker() override;

  AmqpBroker(const AmqpBroker&)            = delete;
  AmqpBroker& operator=(const AmqpBroker&) = delete;

  std::optional<Delivery> NextDelivery() override;
  void Publish(const std::string& correlation_id, const std::string& exchange, const std::string& routing_key, bool durable,
               const std::string& body) override;
  void Ack(uint64_t delivery_tag) override;
  void Nack(uint64_t delivery_tag, bool requeue) override;

  std::optional<std::string> WaitForConnectionLoss() override;
  void                       Close() override;

 private:
  struct ConnectionDeleter {
    void operator()(amqp_connection_state_t conn) const;
  };

  void Connect();
  void CheckReply(const amqp_rpc_reply_t& reply, const std::string& context);
  // Handles a frame that arrived outside of a consume; false if the connection died.
  bool HandleStrayFrame(const amqp_frame_t& frame);
  void AwaitConfirm(uint64_t sequence);
  void MarkLost(const std::string& reason);
  bool Lost() const;

  sda::runtime::config::BrokerConfig                          config_;
  std::unique_ptr<amqp_connection_state_t_, ConnectionDeleter> conn_;
  const amqp_channel_t                                        channel_ = 1;
  bool                                                        confirms_;
  uint64_t                                                    publish_sequence_ = 0;

  std::atomic<bool>          closing_{false};
  mutable std::mutex         mutex_;
  std::condition_variable    cv_;
  std::optional<std::string> lost_;
  bool                       closed_ = false;
};

} // namespace sda::mq::amqp
