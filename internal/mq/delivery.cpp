#include "delivery.hpp"

#include "internal/util/errors.hpp"

namespace sda::mq {

Delivery::Delivery(Acknowledger* acknowledger, uint64_t tag, std::string body, std::string correlation_id)
    : acknowledger_(acknowledger), tag_(tag), body_(std::move(body)), correlation_id_(std::move(correlation_id)) {
}

void Delivery::MarkResolved() {
  if (resolved_) {
    throw util::InvalidState("delivery " + std::to_string(tag_) + " already resolved");
  }
  resolved_ = true;
}

void Delivery::Ack() {
  MarkResolved();
  acknowledger_->Ack(tag_);
}

void Delivery::Nack(bool requeue) {
  MarkResolved();
  acknowledger_->Nack(tag_, requeue);
}

} // namespace sda::mq
