#include "sync_handler.hpp"

#include "internal/mq/json_codec.hpp"
#include "internal/observability/logging.hpp"
#include "internal/storage/common/arrow_utils.hpp"
#include "internal/util/errors.hpp"
#include "sda/messages/v1/messages.pb.h"

namespace sda::worker {

using observability::IntField;
using observability::StringField;

namespace {

class SyncJob final : public Job {
 public:
  SyncJob(sda::messages::v1::IngestionAccession message, storage::StorageBackendPtr archive,
          storage::StorageBackendPtr backup, db::RepositoryPtr repository, std::shared_ptr<const mq::SchemaValidator> validator)
      : message_(std::move(message)),
        archive_(std::move(archive)),
        backup_(std::move(backup)),
        repository_(std::move(repository)),
        validator_(std::move(validator)) {
    context_ = JobContext{message_.user(), message_.filepath(), message_.accession_id()};
  }

  const JobContext& Context() const override {
    return context_;
  }

  void Process() override;

  OutboundMessage BuildOutbound() const override;

  void Persist() override;

 private:
  void Copy(const db::model::ArchivedFile& archived);

  sda::messages::v1::IngestionAccession      message_;
  storage::StorageBackendPtr                 archive_;
  storage::StorageBackendPtr                 backup_;
  db::RepositoryPtr                          repository_;
  std::shared_ptr<const mq::SchemaValidator> validator_;

  JobContext  context_;
  std::string sha256_;
};

/*
  The database keys archived files by the decrypted sha256. When the
  message lists it more than once the last entry wins.
*/
void SyncJob::Process() {
  for (const auto& checksum : message_.decrypted_checksums()) {
    if (checksum.type() == "sha256") sha256_ = checksum.value();
  }
  if (sha256_.empty()) throw util::ValidationError("no sha256 in decrypted_checksums");

  auto archived = repository_->GetArchived(message_.user(), message_.filepath(), sha256_);
  if (!archived) {
    throw util::LookupError("no archived file for " + message_.user() + ":" + message_.filepath());
  }

  Copy(*archived);
}

void SyncJob::Copy(const db::model::ArchivedFile& archived) {
  SDA_LOG_INFO("sync initiated", {StringField("archive_path", archived.archive_path), IntField("size", archived.archive_size)});

  auto reader = archive_->NewFileReader(archived.archive_path);
  auto writer = backup_->NewFileWriter(archived.archive_path);

  auto copied = storage::common::CopyStream(*reader, *writer);

  auto close_status = reader->Close();
  if (!close_status.ok()) {
    SDA_LOG_WARN("closing archive reader failed", {StringField("error", close_status.ToString())});
  }

  if (!copied.ok()) {
    auto abort_status = writer->Abort();
    if (!abort_status.ok()) SDA_LOG_WARN("aborting backup writer failed", {StringField("error", abort_status.ToString())});
    throw util::TransientIOError("copy " + archived.archive_path + ": " + copied.status().ToString());
  }

  if (*copied != archived.archive_size) {
    auto abort_status = writer->Abort();
    if (!abort_status.ok()) SDA_LOG_WARN("aborting backup writer failed", {StringField("error", abort_status.ToString())});
    throw util::TransientIOError("copy " + archived.archive_path + ": copied " + std::to_string(*copied) + " bytes, expected " +
                                 std::to_string(archived.archive_size));
  }

  // Close completes the write (rename or multipart upload).
  storage::common::Unwrap(writer->Close());

  SDA_LOG_INFO("synced file", {StringField("archive_path", archived.archive_path), IntField("size", *copied)});
}

OutboundMessage SyncJob::BuildOutbound() const {
  sda::messages::v1::IngestionCompletion completion;
  completion.set_user(message_.user());
  completion.set_filepath(message_.filepath());
  completion.set_accession_id(message_.accession_id());
  *completion.mutable_decrypted_checksums() = message_.decrypted_checksums();

  OutboundMessage outbound{std::string(mq::kSchemaIngestionCompletion), mq::EncodeJson(completion)};
  validator_->Check(outbound.schema, outbound.body);
  return outbound;
}

void SyncJob::Persist() {
  auto result = repository_->MarkReady(message_.accession_id(), message_.user(), message_.filepath(), sha256_);
  if (result) return;

  if (result.Permanent()) {
    throw util::ValidationError("MarkReady: " + result.message);
  }
  throw util::TransientIOError("MarkReady: " + result.Describe());
}

} // namespace

SyncHandler::SyncHandler(storage::StorageBackendPtr archive, storage::StorageBackendPtr backup, db::RepositoryPtr repository,
                         std::shared_ptr<const mq::SchemaValidator> validator)
    : archive_(std::move(archive)), backup_(std::move(backup)), repository_(std::move(repository)), validator_(std::move(validator)) {
}

std::string_view SyncHandler::InboundSchema() const {
  return mq::kSchemaIngestionAccession;
}

std::unique_ptr<Job> SyncHandler::NewJob(const std::string& body) {
  return std::make_unique<SyncJob>(mq::DecodeJson<sda::messages::v1::IngestionAccession>(body), archive_, backup_, repository_,
                                   validator_);
}

} // namespace sda::worker
