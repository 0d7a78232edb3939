#pragma once

#include <arrow/io/interfaces.h>

#include <cstdint>
#include <memory>
#include <string>

#include "internal/crypt4gh/key_file.hpp"

namespace sda::verify {

struct VerificationResult {
  // Plaintext bytes after decryption (and edit list).
  int64_t decrypted_size = 0;
  // Bytes read from the archive body.
  int64_t archive_bytes_read = 0;

  std::string encrypted_sha256;
  std::string decrypted_sha256;
  std::string decrypted_md5;
};

/*
  Single pass decrypt + checksum of an archived Crypt4GH file.

      header ─┐
              ├─ concat ─ decrypt ─ observe(md5, sha256) ─ discard
      body ─ observe(sha256) ─┘

  The stored header is prepended to the archived body (which holds
  only segments); the encrypted checksum covers the body bytes exactly
  as read from storage.

  Errors:
    util::DecryptError      → bad header, wrong key, corrupt body
    util::TransientIOError  → storage read failed
*/
class VerificationPipeline {
 public:
  explicit VerificationPipeline(crypt4gh::PrivateKey key);

  // Consumes and closes body.
  VerificationResult Verify(const std::string& header, std::shared_ptr<arrow::io::InputStream> body) const;

 private:
  crypt4gh::PrivateKey key_;
};

} // namespace sda::verify
