#pragma once

#include <memory>
#include <optional>
#include <string>

#include "delivery.hpp"

namespace sda::mq {

/*
  Message broker as seen by a worker.

  Threading: NextDelivery / Publish / Ack / Nack are called from the
  worker loop thread only. WaitForConnectionLoss is called from the
  watcher thread, Close from any thread.
*/
class Broker : public Acknowledger {
 public:
  ~Broker() override = default;

  // Blocks for the next delivery of the subscribed queue; nullopt once closed.
  virtual std::optional<Delivery> NextDelivery() = 0;

  // Throws util::PublishError when the broker did not accept the message.
  virtual void Publish(const std::string& correlation_id, const std::string& exchange, const std::string& routing_key, bool durable,
                       const std::string& body) = 0;

  // Blocks until the connection is lost (returns the reason) or Close() (nullopt).
  virtual std::optional<std::string> WaitForConnectionLoss() = 0;

  // Unblocks NextDelivery and WaitForConnectionLoss.
  virtual void Close() = 0;
};

using BrokerPtr = std::shared_ptr<Broker>;

} // namespace sda::mq
