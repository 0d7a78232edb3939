#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "internal/mq/schema_validator.hpp"
#include "internal/storage/storage_backend.hpp"
#include "internal/verify/verification_pipeline.hpp"
#include "message_handler.hpp"

namespace sda::worker {

/*
  Verify worker.

  ingestion-verification → decrypt the archived file with its stored
  header, checksum both sides, mark the file COMPLETED, publish
  ingestion-accession-request (sha256 then md5).

  re_verify messages only run the pipeline. A missing header is
  rejected and reported: nothing will create it later.
*/
class VerifyHandler final : public MessageHandler {
 public:
  VerifyHandler(storage::StorageBackendPtr archive, db::RepositoryPtr repository, std::shared_ptr<const verify::VerificationPipeline> pipeline,
                std::shared_ptr<const mq::SchemaValidator> validator);

  std::string_view     InboundSchema() const override;
  std::unique_ptr<Job> NewJob(const std::string& body) override;
  LookupFailurePolicy  OnLookupFailure() const override {
    return LookupFailurePolicy::kReject;
  }

 private:
  storage::StorageBackendPtr                    archive_;
  db::RepositoryPtr                             repository_;
  std::shared_ptr<const verify::VerificationPipeline> pipeline_;
  std::shared_ptr<const mq::SchemaValidator>    validator_;
};

} // namespace sda::worker
