#include "internal/verify/verification_pipeline.hpp"

#include <arrow/buffer.h>
#include <arrow/io/memory.h>

#include <algorithm>
#include <cassert>
#include <cstring>
#include <iostream>
#include <string>

#include "internal/checksum/digest.hpp"
#include "internal/util/errors.hpp"
#include "tests/unit/support/crypt4gh_writer.hpp"
#include "tests/unit/support/fixtures.hpp"

namespace {

using sda::checksum::Algorithm;
using sda::checksum::HexDigestOf;
using sda::verify::VerificationPipeline;

std::shared_ptr<arrow::io::BufferReader> Source(const std::string& bytes) {
  return std::make_shared<arrow::io::BufferReader>(arrow::Buffer::FromString(bytes));
}

// Serves `good` bytes, then fails every read.
class FailingStream final : public arrow::io::InputStream {
 public:
  explicit FailingStream(std::string good) : good_(std::move(good)) {
  }

  arrow::Status Close() override {
    closed_ = true;
    return arrow::Status::OK();
  }
  bool closed() const override {
    return closed_;
  }
  arrow::Result<int64_t> Tell() const override {
    return static_cast<int64_t>(pos_);
  }

  arrow::Result<int64_t> Read(int64_t nbytes, void* out) override {
    if (pos_ >= good_.size()) return arrow::Status::IOError("connection reset by peer");
    const auto n = std::min<std::size_t>(static_cast<std::size_t>(nbytes), good_.size() - pos_);
    std::memcpy(out, good_.data() + pos_, n);
    pos_ += n;
    return static_cast<int64_t>(n);
  }

  arrow::Result<std::shared_ptr<arrow::Buffer>> Read(int64_t nbytes) override {
    ARROW_ASSIGN_OR_RAISE(auto buffer, arrow::AllocateResizableBuffer(nbytes));
    ARROW_ASSIGN_OR_RAISE(auto n, Read(nbytes, buffer->mutable_data()));
    ARROW_RETURN_NOT_OK(buffer->Resize(n, false));
    return std::shared_ptr<arrow::Buffer>(std::move(buffer));
  }

 private:
  std::string good_;
  std::size_t pos_    = 0;
  bool        closed_ = false;
};

std::string Plaintext(std::size_t n) {
  std::string out(n, '\0');
  for (std::size_t i = 0; i < n; ++i) out[i] = static_cast<char>(i % 251);
  return out;
}

void TestChecksumsOfBothSides() {
  const auto key       = sda::testing::GenerateKey();
  const auto plaintext = Plaintext(150000);
  const auto file      = sda::testing::Encrypt(plaintext, key.public_key);

  VerificationPipeline pipeline(key);
  auto                 body   = Source(file.body);
  const auto           result = pipeline.Verify(file.header, body);

  assert(result.decrypted_size == 150000);
  assert(result.archive_bytes_read == static_cast<int64_t>(file.body.size()));
  // the encrypted checksum covers the archived body, not the stored header
  assert(result.encrypted_sha256 == HexDigestOf(Algorithm::kSha256, file.body));
  assert(result.decrypted_sha256 == HexDigestOf(Algorithm::kSha256, plaintext));
  assert(result.decrypted_md5 == HexDigestOf(Algorithm::kMd5, plaintext));
  assert(body->closed());
}

// File written by an independent encryptor; a session key mismatch would reject it.
void TestReferenceFileDigests() {
  namespace ref = sda::testing::reference;
  const auto key  = sda::crypt4gh::LoadPrivateKey(sda::testing::FixturePath(ref::kKeyFile), ref::kPassphrase);
  const auto file = sda::testing::ReadFixture(ref::kFile);

  auto       body   = Source(file.substr(ref::kHeaderSize));
  const auto result = VerificationPipeline(key).Verify(file.substr(0, ref::kHeaderSize), body);

  assert(result.decrypted_size == ref::kPlaintextSize);
  assert(result.archive_bytes_read == ref::kBodySize);
  assert(result.encrypted_sha256 == ref::kBodySha256);
  assert(result.decrypted_sha256 == ref::kPlaintextSha256);
  assert(result.decrypted_md5 == ref::kPlaintextMd5);
  assert(body->closed());
}

void TestEmptyFile() {
  const auto key  = sda::testing::GenerateKey();
  const auto file = sda::testing::Encrypt("", key.public_key);

  const auto result = VerificationPipeline(key).Verify(file.header, Source(file.body));
  assert(result.decrypted_size == 0);
  assert(result.archive_bytes_read == 0);
  assert(result.decrypted_md5 == "d41d8cd98f00b204e9800998ecf8427e");
}

void TestWrongKeyIsPermanent() {
  const auto key   = sda::testing::GenerateKey();
  const auto wrong = sda::testing::GenerateKey();
  const auto file  = sda::testing::Encrypt(Plaintext(10), key.public_key);

  bool threw = false;
  try {
    (void)VerificationPipeline(wrong).Verify(file.header, Source(file.body));
  } catch (const sda::util::DecryptError&) {
    threw = true;
  }
  assert(threw);
}

void TestCorruptBodyIsPermanent() {
  const auto key  = sda::testing::GenerateKey();
  const auto file = sda::testing::Encrypt(Plaintext(1000), key.public_key);

  auto body = file.body;
  body[body.size() - 1] ^= 0x80;

  bool threw = false;
  try {
    (void)VerificationPipeline(key).Verify(file.header, Source(body));
  } catch (const sda::util::DecryptError&) {
    threw = true;
  }
  assert(threw);
}

void TestStorageErrorIsTransient() {
  const auto key  = sda::testing::GenerateKey();
  const auto file = sda::testing::Encrypt(Plaintext(100000), key.public_key);

  auto body  = std::make_shared<FailingStream>(file.body.substr(0, 1000));
  bool threw = false;
  try {
    (void)VerificationPipeline(key).Verify(file.header, body);
  } catch (const sda::util::TransientIOError& e) {
    threw = std::string(e.what()).find("connection reset") != std::string::npos;
  }
  assert(threw);
  assert(body->closed());
}

} // namespace

int main() {
  TestChecksumsOfBothSides();
  TestReferenceFileDigests();
  TestEmptyFile();
  TestWrongKeyIsPermanent();
  TestCorruptBodyIsPermanent();
  TestStorageErrorIsTransient();

  std::cout << "sda_unit_verification_pipeline: pass\n";
  return 0;
}
