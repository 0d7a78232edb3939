#include "verification_pipeline.hpp"

#include <arrow/buffer.h>
#include <arrow/io/memory.h>

#include "internal/checksum/digest.hpp"
#include "internal/crypt4gh/decrypt_status.hpp"
#include "internal/crypt4gh/decrypting_stream.hpp"
#include "internal/observability/logging.hpp"
#include "internal/storage/common/arrow_utils.hpp"
#include "internal/stream/concat_input_stream.hpp"
#include "internal/stream/observing_input_stream.hpp"
#include "internal/util/errors.hpp"

namespace sda::verify {

namespace {

[[noreturn]] void Raise(const arrow::Status& status) {
  if (crypt4gh::IsDecryptFailure(status)) throw util::DecryptError(status.message());
  throw util::TransientIOError(status.ToString());
}

} // namespace

VerificationPipeline::VerificationPipeline(crypt4gh::PrivateKey key) : key_(key) {
}

VerificationResult VerificationPipeline::Verify(const std::string& header, std::shared_ptr<arrow::io::InputStream> body) const {
  checksum::Digest encrypted_sha256(checksum::Algorithm::kSha256);
  checksum::Digest decrypted_sha256(checksum::Algorithm::kSha256);
  checksum::Digest decrypted_md5(checksum::Algorithm::kMd5);

  auto archive = std::make_shared<stream::ObservingInputStream>(std::move(body), std::vector{encrypted_sha256.Observer()});
  auto header_stream = std::make_shared<arrow::io::BufferReader>(arrow::Buffer::FromString(header));
  auto joined        = std::make_shared<stream::ConcatInputStream>(
      std::vector<std::shared_ptr<arrow::io::InputStream>>{std::move(header_stream), archive});

  auto decrypted = crypt4gh::DecryptingInputStream::Open(joined, key_);
  if (!decrypted.ok()) {
    auto close_status = joined->Close();
    if (!close_status.ok()) SDA_LOG_WARN("archive stream close failed", {observability::StringField("error", close_status.ToString())});
    Raise(decrypted.status());
  }

  stream::ObservingInputStream plaintext(*decrypted, {decrypted_md5.Observer(), decrypted_sha256.Observer()});
  arrow::io::MockOutputStream  discard;

  auto copied       = storage::common::CopyStream(plaintext, discard);
  auto close_status = plaintext.Close();
  if (!copied.ok()) Raise(copied.status());
  if (!close_status.ok()) Raise(close_status);

  VerificationResult result;
  result.decrypted_size     = *copied;
  result.archive_bytes_read = archive->BytesObserved();
  result.encrypted_sha256   = encrypted_sha256.HexDigest();
  result.decrypted_sha256   = decrypted_sha256.HexDigest();
  result.decrypted_md5      = decrypted_md5.HexDigest();
  return result;
}

} // namespace sda::verify
