#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "internal/mq/schema_validator.hpp"
#include "internal/storage/storage_backend.hpp"
#include "message_handler.hpp"

namespace sda::worker {

/*
  Copy worker (sync).

  ingestion-accession → copy archive/<path> to backup/<path>, check the
  byte count against the archived size, mark the file READY under its
  accession id, publish ingestion-completion.

  A missing archive record is requeued: ingestion may not have
  finished writing it yet.
*/
class SyncHandler final : public MessageHandler {
 public:
  SyncHandler(storage::StorageBackendPtr archive, storage::StorageBackendPtr backup, db::RepositoryPtr repository,
              std::shared_ptr<const mq::SchemaValidator> validator);

  std::string_view     InboundSchema() const override;
  std::unique_ptr<Job> NewJob(const std::string& body) override;
  LookupFailurePolicy  OnLookupFailure() const override {
    return LookupFailurePolicy::kRequeue;
  }

 private:
  storage::StorageBackendPtr                 archive_;
  storage::StorageBackendPtr                 backup_;
  db::RepositoryPtr                          repository_;
  std::shared_ptr<const mq::SchemaValidator> validator_;
};

} // namespace sda::worker
