#pragma once

#include <memory>
#include <string>
#include <string_view>

#include "internal/mq/broker.hpp"
#include "internal/mq/schema_validator.hpp"
#include "message_handler.hpp"

namespace sda::worker {

struct Routing {
  std::string exchange;
  std::string routing_key;
  std::string routing_error;
  bool        durable = true;
};

/*
  Per delivery state machine:

      received → validated → processed → persisted → published → acknowledged
          │          │           │            │            │
          └──────────┴───────────┴────────────┴────────────┴──→ rejected / requeued

  Failure policy:
    ValidationError, DecryptError, InvalidPath  → nack(requeue=false) + one error report
    LookupError                                 → handler policy
    TransientIOError, NotFound, PublishError    → nack(requeue=true)
    ack failure                                 → logged only
*/
enum class Stage {
  kReceived,
  kValidated,
  kProcessed,
  kPersisted,
  kPublished,
  kAcknowledged,
  kRejected,
};

std::string_view ToString(Stage stage);

/*
  Sequential consumer: one delivery in flight, resolved before the
  next one is fetched.
*/
class WorkerLoop {
 public:
  WorkerLoop(mq::BrokerPtr broker, std::shared_ptr<const mq::SchemaValidator> validator, std::shared_ptr<MessageHandler> handler,
             Routing routing);

  // Until the broker stops delivering (Close() or connection loss).
  void Run();

  // Drives one delivery to resolution; returns the last stage reached.
  Stage ProcessDelivery(mq::Delivery& delivery);

 private:
  void Reject(mq::Delivery& delivery, const JobContext& context, std::string_view error, const std::string& reason);
  void Requeue(mq::Delivery& delivery, const JobContext& context, Stage stage, const std::string& reason);
  void ReportError(const mq::Delivery& delivery, std::string_view error, const std::string& reason);

  mq::BrokerPtr                              broker_;
  std::shared_ptr<const mq::SchemaValidator> validator_;
  std::shared_ptr<MessageHandler>            handler_;
  Routing                                    routing_;
};

} // namespace sda::worker
