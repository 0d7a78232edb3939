#pragma once

#include <openssl/evp.h>

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

#include "internal/stream/observing_input_stream.hpp"

namespace sda::checksum {

enum class Algorithm { kSha256, kMd5 };

// "sha256" / "md5", as carried in messages and the database.
std::string_view ToString(Algorithm algorithm);

/*
  Incremental message digest (OpenSSL EVP).

  HexDigest() finalizes; Update() after that throws.
*/
class Digest {
 public:
  explicit Digest(Algorithm algorithm);

  void Update(const uint8_t* data, int64_t length);
  void Update(std::string_view data);

  // Lowercase hex.
  std::string HexDigest();

  Algorithm GetAlgorithm() const {
    return algorithm_;
  }

  // Feeds this digest from an ObservingInputStream. Digest must outlive the stream.
  stream::ObservingInputStream::Observer Observer();

 private:
  struct CtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const {
      EVP_MD_CTX_free(ctx);
    }
  };

  Algorithm                               algorithm_;
  std::unique_ptr<EVP_MD_CTX, CtxDeleter> ctx_;
  std::string                             hex_;
  bool                                    finalized_ = false;
};

// One-shot helper.
std::string HexDigestOf(Algorithm algorithm, std::string_view data);

} // namespace sda::checksum
