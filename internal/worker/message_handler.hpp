#pragma once

#include <memory>
#include <string>
#include <string_view>

namespace sda::worker {

// Identifies a unit of work in every log line and error report.
struct JobContext {
  std::string user;
  std::string filepath;
  std::string accession_id;
};

struct OutboundMessage {
  std::string schema;
  std::string body;
};

/*
  One validated message's unit of work.

  WorkerLoop drives it through:

      Process() → BuildOutbound() → Persist() → publish

  Errors are reported by throwing the util:: error types; WorkerLoop
  turns them into broker dispositions.
*/
class Job {
 public:
  virtual ~Job() = default;

  virtual const JobContext& Context() const = 0;

  virtual void Process() = 0;

  // False when the work is a pure check: nothing is persisted or published.
  virtual bool RecordsResult() const {
    return true;
  }

  // Built and schema checked before Persist(); throws util::ValidationError.
  virtual OutboundMessage BuildOutbound() const = 0;

  virtual void Persist() = 0;
};

enum class LookupFailurePolicy {
  // Leave the message for a later retry (state may still appear).
  kRequeue,
  // Drop it and report it on the error routing key.
  kReject,
};

/*
  Worker kind specific part of the loop.
*/
class MessageHandler {
 public:
  virtual ~MessageHandler() = default;

  virtual std::string_view InboundSchema() const = 0;

  // body has passed InboundSchema validation.
  virtual std::unique_ptr<Job> NewJob(const std::string& body) = 0;

  virtual LookupFailurePolicy OnLookupFailure() const = 0;
};

} // namespace sda::worker
