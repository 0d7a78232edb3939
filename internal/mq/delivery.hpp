#pragma once

#include <cstdint>
#include <string>

namespace sda::mq {

/*
  Broker side of a delivery's resolution. Throws on failure.
*/
class Acknowledger {
 public:
  virtual ~Acknowledger() = default;

  virtual void Ack(uint64_t delivery_tag)                = 0;
  virtual void Nack(uint64_t delivery_tag, bool requeue) = 0;
};

/*
  One inbound message instance.

  Resolved exactly once, by Ack() or Nack(). A second resolution is a
  programming error and throws util::InvalidState. A resolution whose
  broker call failed still counts: the broker will redeliver.
*/
class Delivery {
 public:
  Delivery(Acknowledger* acknowledger, uint64_t tag, std::string body, std::string correlation_id);

  const std::string& Body() const {
    return body_;
  }
  const std::string& CorrelationId() const {
    return correlation_id_;
  }
  uint64_t Tag() const {
    return tag_;
  }
  bool Resolved() const {
    return resolved_;
  }

  void Ack();
  void Nack(bool requeue);

 private:
  void MarkResolved();

  Acknowledger* acknowledger_;
  uint64_t      tag_;
  std::string   body_;
  std::string   correlation_id_;
  bool          resolved_ = false;
};

} // namespace sda::mq
