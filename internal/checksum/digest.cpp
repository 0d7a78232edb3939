#include "digest.hpp"

#include <stdexcept>

#include "internal/util/errors.hpp"
#include "internal/util/hex.hpp"

namespace sda::checksum {

namespace {

const EVP_MD* MessageDigest(Algorithm algorithm) {
  switch (algorithm) {
    case Algorithm::kSha256:
      return EVP_sha256();
    case Algorithm::kMd5:
      return EVP_md5();
  }
  throw std::invalid_argument("unknown digest algorithm");
}

} // namespace

std::string_view ToString(Algorithm algorithm) {
  switch (algorithm) {
    case Algorithm::kSha256:
      return "sha256";
    case Algorithm::kMd5:
      return "md5";
  }
  return "unknown";
}

Digest::Digest(Algorithm algorithm) : algorithm_(algorithm), ctx_(EVP_MD_CTX_new()) {
  if (!ctx_ || EVP_DigestInit_ex(ctx_.get(), MessageDigest(algorithm), nullptr) != 1) {
    throw std::runtime_error("EVP_DigestInit_ex failed");
  }
}

void Digest::Update(const uint8_t* data, int64_t length) {
  if (finalized_) throw util::InvalidState("digest already finalized");
  if (length <= 0) return;
  if (EVP_DigestUpdate(ctx_.get(), data, static_cast<size_t>(length)) != 1) {
    throw std::runtime_error("EVP_DigestUpdate failed");
  }
}

void Digest::Update(std::string_view data) {
  Update(reinterpret_cast<const uint8_t*>(data.data()), static_cast<int64_t>(data.size()));
}

std::string Digest::HexDigest() {
  if (finalized_) return hex_;

  unsigned char md[EVP_MAX_MD_SIZE];
  unsigned int  len = 0;
  if (EVP_DigestFinal_ex(ctx_.get(), md, &len) != 1) {
    throw std::runtime_error("EVP_DigestFinal_ex failed");
  }
  finalized_ = true;
  hex_       = util::HexEncode(md, len);
  return hex_;
}

stream::ObservingInputStream::Observer Digest::Observer() {
  return [this](const uint8_t* data, int64_t length) { Update(data, length); };
}

std::string HexDigestOf(Algorithm algorithm, std::string_view data) {
  Digest digest(algorithm);
  digest.Update(data);
  return digest.HexDigest();
}

} // namespace sda::checksum
