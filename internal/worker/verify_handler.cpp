#include "verify_handler.hpp"

#include "internal/mq/json_codec.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "sda/messages/v1/messages.pb.h"

namespace sda::worker {

using observability::IntField;
using observability::StringField;

namespace {

class VerifyJob final : public Job {
 public:
  VerifyJob(sda::messages::v1::IngestionVerification message, storage::StorageBackendPtr archive, db::RepositoryPtr repository,
            std::shared_ptr<const verify::VerificationPipeline> pipeline, std::shared_ptr<const mq::SchemaValidator> validator)
      : message_(std::move(message)),
        archive_(std::move(archive)),
        repository_(std::move(repository)),
        pipeline_(std::move(pipeline)),
        validator_(std::move(validator)),
        context_{message_.user(), message_.filepath(), {}} {
  }

  const JobContext& Context() const override {
    return context_;
  }

  void Process() override;

  bool RecordsResult() const override {
    return !message_.re_verify();
  }

  OutboundMessage BuildOutbound() const override;

  void Persist() override;

 private:
  sda::messages::v1::IngestionVerification            message_;
  storage::StorageBackendPtr                          archive_;
  db::RepositoryPtr                                   repository_;
  std::shared_ptr<const verify::VerificationPipeline> pipeline_;
  std::shared_ptr<const mq::SchemaValidator>          validator_;

  JobContext                 context_;
  int64_t                    archive_size_ = 0;
  verify::VerificationResult result_;
};

void VerifyJob::Process() {
  auto header = repository_->GetHeader(message_.file_id());
  if (!header) {
    throw util::LookupError("no header stored for file " + std::to_string(message_.file_id()));
  }

  archive_size_ = archive_->GetFileSize(message_.archive_path());
  result_       = pipeline_->Verify(*header, archive_->NewFileReader(message_.archive_path()));

  if (result_.archive_bytes_read != archive_size_) {
    throw util::TransientIOError("archive file " + message_.archive_path() + " changed size while reading: " +
                                 std::to_string(archive_size_) + " -> " + std::to_string(result_.archive_bytes_read));
  }

  SDA_LOG_INFO("file verified", {StringField("archive_path", message_.archive_path()), IntField("archive_size", archive_size_),
                                 IntField("decrypted_size", result_.decrypted_size),
                                 StringField("decrypted_sha256", result_.decrypted_sha256),
                                 observability::BoolField("re_verify", message_.re_verify())});
}

OutboundMessage VerifyJob::BuildOutbound() const {
  sda::messages::v1::IngestionAccessionRequest request;
  request.set_user(message_.user());
  request.set_filepath(message_.filepath());

  auto* sha256 = request.add_decrypted_checksums();
  sha256->set_type("sha256");
  sha256->set_value(result_.decrypted_sha256);

  auto* md5 = request.add_decrypted_checksums();
  md5->set_type("md5");
  md5->set_value(result_.decrypted_md5);

  OutboundMessage outbound{std::string(mq::kSchemaIngestionAccessionRequest), mq::EncodeJson(request)};
  validator_->Check(outbound.schema, outbound.body);
  return outbound;
}

void VerifyJob::Persist() {
  db::model::FileInfo info;
  info.archive_size       = archive_size_;
  info.archive_checksum   = result_.encrypted_sha256;
  info.decrypted_size     = result_.decrypted_size;
  info.decrypted_checksum = result_.decrypted_sha256;

  auto result = repository_->MarkCompleted(info, message_.file_id());
  if (!result) {
    throw util::TransientIOError("MarkCompleted: " + result.Describe());
  }
}

} // namespace

VerifyHandler::VerifyHandler(storage::StorageBackendPtr archive, db::RepositoryPtr repository,
                             std::shared_ptr<const verify::VerificationPipeline> pipeline,
                             std::shared_ptr<const mq::SchemaValidator>          validator)
    : archive_(std::move(archive)), repository_(std::move(repository)), pipeline_(std::move(pipeline)), validator_(std::move(validator)) {
}

std::string_view VerifyHandler::InboundSchema() const {
  return mq::kSchemaIngestionVerification;
}

std::unique_ptr<Job> VerifyHandler::NewJob(const std::string& body) {
  return std::make_unique<VerifyJob>(mq::DecodeJson<sda::messages::v1::IngestionVerification>(body), archive_, repository_, pipeline_,
                                     validator_);
}

} // namespace sda::worker
