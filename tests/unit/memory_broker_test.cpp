#include "internal/mq/memory/memory_broker.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <optional>
#include <string>
#include <thread>

#include "internal/util/errors.hpp"

namespace {

using sda::mq::memory::MemoryBroker;

template <typename E, typename Fn>
bool Throws(Fn&& fn) {
  try {
    fn();
  } catch (const E&) {
    return true;
  }
  return false;
}

void TestDeliveriesInOrderWithCorrelation() {
  MemoryBroker broker;
  broker.Push("first", "corr-1");
  broker.Push("second");

  auto a = broker.NextDelivery();
  auto b = broker.NextDelivery();
  assert(a && a->Body() == "first" && a->CorrelationId() == "corr-1");
  assert(b && b->Body() == "second" && b->CorrelationId().empty());
  assert(a->Tag() != b->Tag());
  assert(broker.Pending() == 0);
}

void TestDeliveryResolvesExactlyOnce() {
  MemoryBroker broker;
  broker.Push("m");

  auto d = broker.NextDelivery();
  assert(!d->Resolved());
  d->Ack();
  assert(d->Resolved());
  assert(broker.Acks().size() == 1);

  assert(Throws<sda::util::InvalidState>([&] { d->Ack(); }));
  assert(Throws<sda::util::InvalidState>([&] { d->Nack(true); }));
  assert(broker.Acks().size() == 1);
  assert(broker.Nacks().empty());
}

void TestFailedAckStillResolves() {
  MemoryBroker broker;
  broker.Push("m");
  broker.FailAcks(true);

  auto d = broker.NextDelivery();
  assert(Throws<sda::util::TransientIOError>([&] { d->Ack(); }));
  assert(d->Resolved());
  assert(broker.Acks().empty());
}

void TestRequeueGoesToFrontWithNewTag() {
  MemoryBroker broker;
  broker.Push("retry-me");
  broker.Push("next");

  auto d       = broker.NextDelivery();
  const auto t = d->Tag();
  d->Nack(true);

  auto again = broker.NextDelivery();
  assert(again->Body() == "retry-me");
  assert(again->Tag() != t);
  again->Nack(false);

  auto next = broker.NextDelivery();
  assert(next->Body() == "next");

  const auto nacks = broker.Nacks();
  assert(nacks.size() == 2);
  assert(nacks[0].tag == t && nacks[0].requeue);
  assert(!nacks[1].requeue);
}

void TestPublishRecordsAndFails() {
  MemoryBroker broker;
  broker.Publish("c", "sda", "completed", true, "{}");
  broker.FailPublishes(true);
  assert(Throws<sda::util::PublishError>([&] { broker.Publish("c", "sda", "completed", true, "{}"); }));

  const auto published = broker.Publishes();
  assert(published.size() == 1);
  assert(published[0].exchange == "sda" && published[0].routing_key == "completed" && published[0].durable);
}

void TestCloseUnblocksConsumerAndWatcher() {
  MemoryBroker broker;

  std::optional<std::string> loss = std::string("unset");
  std::thread                watcher([&] { loss = broker.WaitForConnectionLoss(); });
  std::thread                consumer([&] { assert(!broker.NextDelivery().has_value()); });

  std::this_thread::sleep_for(std::chrono::milliseconds(20));
  broker.Close();
  consumer.join();
  watcher.join();
  assert(!loss.has_value());
}

void TestConnectionLossReportsReason() {
  MemoryBroker broker;
  broker.Push("queued before loss");

  std::optional<std::string> loss;
  std::thread                watcher([&] { loss = broker.WaitForConnectionLoss(); });
  broker.DropConnection("heartbeat timeout");
  watcher.join();

  assert(loss && *loss == "heartbeat timeout");
  assert(Throws<sda::util::PublishError>([&] { broker.Publish("", "sda", "x", true, "{}"); }));
  // queued messages drain, then the consumer stops
  assert(broker.NextDelivery().has_value());
  assert(!broker.NextDelivery().has_value());
}

} // namespace

int main() {
  TestDeliveriesInOrderWithCorrelation();
  TestDeliveryResolvesExactlyOnce();
  TestFailedAckStillResolves();
  TestRequeueGoesToFrontWithNewTag();
  TestPublishRecordsAndFails();
  TestCloseUnblocksConsumerAndWatcher();
  TestConnectionLossReportsReason();

  std::cout << "sda_unit_memory_broker: pass\n";
  return 0;
}
