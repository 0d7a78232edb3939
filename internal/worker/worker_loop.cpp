#include "worker_loop.hpp"

#include "internal/mq/json_codec.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "sda/messages/v1/messages.pb.h"

namespace sda::worker {

using observability::LogField;
using observability::StringField;

namespace {

LogField Corr(const mq::Delivery& delivery) {
  return StringField("corr_id", delivery.CorrelationId());
}

} // namespace

std::string_view ToString(Stage stage) {
  switch (stage) {
    case Stage::kReceived:
      return "received";
    case Stage::kValidated:
      return "validated";
    case Stage::kProcessed:
      return "processed";
    case Stage::kPersisted:
      return "persisted";
    case Stage::kPublished:
      return "published";
    case Stage::kAcknowledged:
      return "acknowledged";
    case Stage::kRejected:
      return "rejected";
  }
  return "unknown";
}

WorkerLoop::WorkerLoop(mq::BrokerPtr broker, std::shared_ptr<const mq::SchemaValidator> validator, std::shared_ptr<MessageHandler> handler,
                       Routing routing)
    : broker_(std::move(broker)), validator_(std::move(validator)), handler_(std::move(handler)), routing_(std::move(routing)) {
}

void WorkerLoop::Run() {
  SDA_LOG_INFO("worker loop started", {StringField("schema", handler_->InboundSchema())});

  while (auto delivery = broker_->NextDelivery()) {
    ProcessDelivery(*delivery);
  }

  SDA_LOG_INFO("worker loop stopped");
}

Stage WorkerLoop::ProcessDelivery(mq::Delivery& delivery) {
  SDA_LOG_DEBUG("received a message", {Corr(delivery), StringField("body", delivery.Body())});

  JobContext context;
  Stage      stage = Stage::kReceived;

  const auto errors = validator_->Validate(handler_->InboundSchema(), delivery.Body());
  if (!errors.empty()) {
    std::string reason;
    for (const auto& error : errors) reason += (reason.empty() ? "" : "; ") + error;
    Reject(delivery, context, "validation of incoming message failed", reason);
    return Stage::kRejected;
  }
  stage = Stage::kValidated;

  try {
    auto job = handler_->NewJob(delivery.Body());
    context  = job->Context();
    SDA_LOG_INFO("received work", {Corr(delivery), StringField("filepath", context.filepath), StringField("user", context.user),
                                   StringField("accession_id", context.accession_id)});

    job->Process();
    stage = Stage::kProcessed;

    if (job->RecordsResult()) {
      const auto outbound = job->BuildOutbound();

      job->Persist();
      stage = Stage::kPersisted;

      broker_->Publish(delivery.CorrelationId(), routing_.exchange, routing_.routing_key, routing_.durable, outbound.body);
      stage = Stage::kPublished;
    }
  } catch (const util::ValidationError& e) {
    Reject(delivery, context, "message rejected", e.what());
    return Stage::kRejected;
  } catch (const util::DecryptError& e) {
    Reject(delivery, context, "decryption failed", e.what());
    return Stage::kRejected;
  } catch (const util::InvalidPath& e) {
    Reject(delivery, context, "invalid storage path", e.what());
    return Stage::kRejected;
  } catch (const util::LookupError& e) {
    if (handler_->OnLookupFailure() == LookupFailurePolicy::kReject) {
      Reject(delivery, context, "lookup failed", e.what());
      return Stage::kRejected;
    }
    Requeue(delivery, context, stage, e.what());
    return stage;
  } catch (const util::PublishError& e) {
    Requeue(delivery, context, stage, std::string("publish failed: ") + e.what());
    return stage;
  } catch (const std::exception& e) {
    // TransientIOError, storage NotFound and anything unexpected: retry later.
    Requeue(delivery, context, stage, e.what());
    return stage;
  }

  try {
    delivery.Ack();
  } catch (const std::exception& e) {
    SDA_LOG_ERROR("failed to ack message after work completed",
                  {Corr(delivery), StringField("filepath", context.filepath), StringField("user", context.user),
                   StringField("error", e.what())});
  }

  SDA_LOG_INFO("work completed", {Corr(delivery), StringField("filepath", context.filepath), StringField("user", context.user),
                                  StringField("accession_id", context.accession_id), StringField("after", ToString(stage))});
  return Stage::kAcknowledged;
}

/*
  The error report goes out before the nack: once the delivery is
  resolved the broker may push the next one onto the channel.
*/
void WorkerLoop::Reject(mq::Delivery& delivery, const JobContext& context, std::string_view error, const std::string& reason) {
  SDA_LOG_ERROR(error, {Corr(delivery), StringField("filepath", context.filepath), StringField("user", context.user),
                        StringField("accession_id", context.accession_id), StringField("reason", reason)});

  ReportError(delivery, error, reason);

  try {
    delivery.Nack(false);
  } catch (const std::exception& e) {
    SDA_LOG_ERROR("failed to nack message", {Corr(delivery), StringField("error", e.what())});
  }
}

void WorkerLoop::Requeue(mq::Delivery& delivery, const JobContext& context, Stage stage, const std::string& reason) {
  SDA_LOG_ERROR("work failed, requeueing", {Corr(delivery), StringField("filepath", context.filepath), StringField("user", context.user),
                                             StringField("accession_id", context.accession_id), StringField("after", ToString(stage)),
                                             StringField("reason", reason)});
  try {
    delivery.Nack(true);
  } catch (const std::exception& e) {
    SDA_LOG_ERROR("failed to nack message", {Corr(delivery), StringField("error", e.what())});
  }
}

void WorkerLoop::ReportError(const mq::Delivery& delivery, std::string_view error, const std::string& reason) {
  sda::messages::v1::InfoError info;
  info.set_error(std::string(error));
  info.set_reason(reason);
  info.set_original_message(delivery.Body());

  try {
    broker_->Publish(delivery.CorrelationId(), routing_.exchange, routing_.routing_error, routing_.durable, mq::EncodeJson(info));
  } catch (const std::exception& e) {
    SDA_LOG_ERROR("failed to publish error report", {Corr(delivery), StringField("error", e.what())});
  }
}

} // namespace sda::worker
