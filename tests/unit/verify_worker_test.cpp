#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>

#include "internal/checksum/digest.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/mq/json_codec.hpp"
#include "internal/mq/memory/memory_broker.hpp"
#include "internal/mq/schema_validator.hpp"
#include "internal/storage/posix/posix_backend.hpp"
#include "internal/storage/storage_backend.hpp"
#include "internal/verify/verification_pipeline.hpp"
#include "internal/worker/verify_handler.hpp"
#include "internal/worker/worker_loop.hpp"
#include "sda/messages/v1/messages.pb.h"
#include "tests/unit/support/crypt4gh_writer.hpp"

namespace {

namespace fs = std::filesystem;

using sda::checksum::Algorithm;
using sda::checksum::HexDigestOf;
using sda::db::model::FileRecord;
using sda::db::model::FileStatus;
using sda::worker::Stage;

const std::string kSha = "82e4e60e7beb3db2e06a00a079788f7d71f75b61a4b75f28c4c942703dabb6d6";

/*
  One archived Crypt4GH file (body on disk, header in the repository)
  and a verify worker loop over a memory broker.
*/
struct VerifyFixture {
  explicit VerifyFixture(const std::string& name, bool use_wrong_key = false) {
    const auto base = fs::temp_directory_path() / "sda_verify_worker_tests" / name;
    fs::remove_all(base);
    archive_root = base / "archive";
    fs::create_directories(archive_root);

    plaintext.resize(100000);
    for (std::size_t i = 0; i < plaintext.size(); ++i) plaintext[i] = static_cast<char>(i % 253);

    const auto key  = sda::testing::GenerateKey();
    file            = sda::testing::Encrypt(plaintext, key.public_key);
    std::ofstream(archive_root / "c0ffee", std::ios::binary) << file.body;

    FileRecord r;
    r.submission_user      = "alice";
    r.submission_file_path = "inbox/f.c4gh";
    r.archive_path         = "c0ffee";
    r.header               = file.header;
    r.status               = FileStatus::kArchived;
    file_id                = repository->Put(r);

    auto archive  = std::make_shared<sda::storage::StorageBackend>(sda::storage::posix::PosixBackend(archive_root));
    auto pipeline = std::make_shared<const sda::verify::VerificationPipeline>(use_wrong_key ? sda::testing::GenerateKey() : key);
    auto handler  = std::make_shared<sda::worker::VerifyHandler>(archive, repository, pipeline, validator);

    loop = std::make_unique<sda::worker::WorkerLoop>(broker, validator, handler, sda::worker::Routing{"sda", "verified", "error", true});
  }

  std::string Message(bool re_verify = false, int64_t id = 0) const {
    return R"({"user":"alice","filepath":"inbox/f.c4gh","file_id":)" + std::to_string(id == 0 ? file_id : id) +
           R"(,"archive_path":"c0ffee","encrypted_checksums":[{"type":"sha256","value":")" + kSha + R"("}],"re_verify":)" +
           (re_verify ? "true" : "false") + "}";
  }

  Stage Deliver(const std::string& body) {
    broker->Push(body);
    auto delivery = broker->NextDelivery();
    assert(delivery.has_value());
    return loop->ProcessDelivery(*delivery);
  }

  FileRecord Row() const {
    return *repository->Get(file_id);
  }

  fs::path                     archive_root;
  std::string                  plaintext;
  sda::testing::EncryptedFile  file;
  int64_t                      file_id = 0;

  std::shared_ptr<sda::mq::memory::MemoryBroker>     broker     = std::make_shared<sda::mq::memory::MemoryBroker>();
  std::shared_ptr<sda::db::memory::MemoryRepository> repository = std::make_shared<sda::db::memory::MemoryRepository>();
  std::shared_ptr<const sda::mq::SchemaValidator>    validator  = std::make_shared<const sda::mq::SchemaValidator>();
  std::unique_ptr<sda::worker::WorkerLoop>           loop;
};

void TestVerifyMarksCompletedAndRequestsAccession() {
  VerifyFixture f("happy");

  assert(f.Deliver(f.Message()) == Stage::kAcknowledged);
  assert(f.broker->Acks().size() == 1);
  assert(f.broker->Nacks().empty());

  const auto published = f.broker->Publishes();
  assert(published.size() == 1);
  assert(published[0].routing_key == "verified");

  auto request = sda::mq::DecodeJson<sda::messages::v1::IngestionAccessionRequest>(published[0].body);
  assert(request.user() == "alice");
  assert(request.decrypted_checksums_size() == 2);
  assert(request.decrypted_checksums(0).type() == "sha256");
  assert(request.decrypted_checksums(0).value() == HexDigestOf(Algorithm::kSha256, f.plaintext));
  assert(request.decrypted_checksums(1).type() == "md5");
  assert(request.decrypted_checksums(1).value() == HexDigestOf(Algorithm::kMd5, f.plaintext));

  const auto row = f.Row();
  assert(row.status == FileStatus::kCompleted);
  assert(row.archive_size == static_cast<int64_t>(f.file.body.size()));
  assert(row.archive_checksum == HexDigestOf(Algorithm::kSha256, f.file.body));
  assert(row.decrypted_size == 100000);
  assert(row.decrypted_checksum == HexDigestOf(Algorithm::kSha256, f.plaintext));
}

void TestVerifyTwiceGivesSameResult() {
  VerifyFixture f("twice");

  assert(f.Deliver(f.Message()) == Stage::kAcknowledged);
  const auto first = f.Row();
  assert(f.Deliver(f.Message()) == Stage::kAcknowledged);
  const auto second = f.Row();

  const auto published = f.broker->Publishes();
  assert(published.size() == 2);
  assert(published[0].body == published[1].body);
  assert(first.archive_checksum == second.archive_checksum);
  assert(first.decrypted_checksum == second.decrypted_checksum);
  assert(second.status == FileStatus::kCompleted);
}

void TestReVerifyOnlyChecks() {
  VerifyFixture f("re_verify");

  assert(f.Deliver(f.Message(true)) == Stage::kAcknowledged);
  assert(f.broker->Acks().size() == 1);
  assert(f.broker->Publishes().empty());
  assert(f.repository->WriteCalls() == 0);
  assert(f.Row().status == FileStatus::kArchived);
}

void TestMissingHeaderIsRejectedAndReported() {
  VerifyFixture f("no_header");

  const auto body = f.Message(false, 9999);
  assert(f.Deliver(body) == Stage::kRejected);

  const auto nacks = f.broker->Nacks();
  assert(nacks.size() == 1 && !nacks[0].requeue);
  const auto published = f.broker->Publishes();
  assert(published.size() == 1 && published[0].routing_key == "error");
  assert(sda::mq::DecodeJson<sda::messages::v1::InfoError>(published[0].body).original_message() == body);
}

void TestWrongKeyIsRejected() {
  VerifyFixture f("wrong_key", true);

  assert(f.Deliver(f.Message()) == Stage::kRejected);
  const auto nacks = f.broker->Nacks();
  assert(nacks.size() == 1 && !nacks[0].requeue);
  assert(f.broker->Publishes().size() == 1);
  assert(f.broker->Publishes()[0].routing_key == "error");
  assert(f.Row().status == FileStatus::kArchived);
}

void TestMissingArchiveObjectIsRequeued() {
  VerifyFixture f("missing_object");
  fs::remove(f.archive_root / "c0ffee");

  assert(f.Deliver(f.Message()) == Stage::kValidated);
  const auto nacks = f.broker->Nacks();
  assert(nacks.size() == 1 && nacks[0].requeue);
  assert(f.broker->Publishes().empty());
}

void TestPersistFailureIsRequeuedWithoutPublish() {
  VerifyFixture f("persist");
  f.repository->FailWrites(true);

  assert(f.Deliver(f.Message()) == Stage::kProcessed);
  const auto nacks = f.broker->Nacks();
  assert(nacks.size() == 1 && nacks[0].requeue);
  assert(f.broker->Publishes().empty());
}

void TestInvalidMessageIsRejected() {
  VerifyFixture f("invalid");

  assert(f.Deliver(R"({"user":"alice","file_id":"x"})") == Stage::kRejected);
  const auto nacks = f.broker->Nacks();
  assert(nacks.size() == 1 && !nacks[0].requeue);
  assert(f.broker->Publishes().size() == 1);
}

} // namespace

int main() {
  TestVerifyMarksCompletedAndRequestsAccession();
  TestVerifyTwiceGivesSameResult();
  TestReVerifyOnlyChecks();
  TestMissingHeaderIsRejectedAndReported();
  TestWrongKeyIsRejected();
  TestMissingArchiveObjectIsRequeued();
  TestPersistFailureIsRequeuedWithoutPublish();
  TestInvalidMessageIsRejected();

  std::cout << "sda_unit_verify_worker: pass\n";
  return 0;
}
