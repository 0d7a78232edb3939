#include "key_file.hpp"

#include <openssl/evp.h>
#include <algorithm>

#include <cctype>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace sda::crypt4gh {

namespace {

constexpr std::string_view kMagic       = "c4gh-v1";
constexpr std::string_view kBeginMarker = "-----BEGIN CRYPT4GH";
constexpr std::string_view kEndMarker   = "-----END CRYPT4GH";

/*
  Sequential reader over the decoded key blob.
*/
class BlobReader {
 public:
  explicit BlobReader(std::string_view data) : data_(data) {
  }

  std::string_view Take(std::size_t n) {
    if (data_.size() - pos_ < n) throw std::runtime_error("crypt4gh key: truncated");
    auto out = data_.substr(pos_, n);
    pos_ += n;
    return out;
  }

  std::string_view String() {
    auto len = Take(2);
    auto n   = static_cast<std::size_t>((static_cast<uint8_t>(len[0]) << 8) | static_cast<uint8_t>(len[1]));
    return Take(n);
  }

 private:
  std::string_view data_;
  std::size_t      pos_ = 0;
};

std::string_view PemBody(std::string_view pem) {
  auto begin = pem.find(kBeginMarker);
  if (begin == std::string_view::npos) throw std::runtime_error("crypt4gh key: missing BEGIN line");
  auto body_start = pem.find('\n', begin);
  auto end        = pem.find(kEndMarker);
  if (body_start == std::string_view::npos || end == std::string_view::npos || end < body_start) {
    throw std::runtime_error("crypt4gh key: missing END line");
  }
  return pem.substr(body_start + 1, end - body_start - 1);
}

uint32_t ReadU32Be(std::string_view bytes) {
  return (static_cast<uint32_t>(static_cast<uint8_t>(bytes[0])) << 24) |
         (static_cast<uint32_t>(static_cast<uint8_t>(bytes[1])) << 16) |
         (static_cast<uint32_t>(static_cast<uint8_t>(bytes[2])) << 8) | static_cast<uint32_t>(static_cast<uint8_t>(bytes[3]));
}

} // namespace

std::string Base64Encode(std::string_view bytes) {
  std::string out(4 * ((bytes.size() + 2) / 3) + 1, '\0');
  int         n = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(out.data()), reinterpret_cast<const unsigned char*>(bytes.data()),
                                  static_cast<int>(bytes.size()));
  out.resize(static_cast<std::size_t>(n));
  return out;
}

std::string Base64Decode(std::string_view text) {
  std::string compact;
  compact.reserve(text.size());
  for (char c : text) {
    if (!std::isspace(static_cast<unsigned char>(c))) compact.push_back(c);
  }
  if (compact.empty() || compact.size() % 4 != 0) throw std::runtime_error("invalid base64");

  std::string out(compact.size() / 4 * 3, '\0');
  int         n = EVP_DecodeBlock(reinterpret_cast<unsigned char*>(out.data()), reinterpret_cast<const unsigned char*>(compact.data()),
                                  static_cast<int>(compact.size()));
  if (n < 0) throw std::runtime_error("invalid base64");

  // EVP_DecodeBlock counts padding as zero bytes.
  std::size_t padding = 0;
  if (compact.back() == '=') ++padding;
  if (compact.size() > 1 && compact[compact.size() - 2] == '=') ++padding;
  out.resize(static_cast<std::size_t>(n) - padding);
  return out;
}

Key DeriveKeyFromPassphrase(std::string_view kdf, const std::string& passphrase, std::string_view salt, uint32_t rounds) {
  Key key{};
  if (kdf == "scrypt") {
    if (EVP_PBE_scrypt(passphrase.data(), passphrase.size(), reinterpret_cast<const unsigned char*>(salt.data()), salt.size(), 1 << 14, 8,
                       1, 0, key.data(), key.size()) != 1) {
      throw std::runtime_error("crypt4gh key: scrypt failed");
    }
    return key;
  }
  if (kdf == "pbkdf2_hmac_sha256") {
    if (PKCS5_PBKDF2_HMAC(passphrase.data(), static_cast<int>(passphrase.size()), reinterpret_cast<const unsigned char*>(salt.data()),
                          static_cast<int>(salt.size()), static_cast<int>(rounds), EVP_sha256(), static_cast<int>(key.size()),
                          key.data()) != 1) {
      throw std::runtime_error("crypt4gh key: pbkdf2 failed");
    }
    return key;
  }
  if (kdf == "bcrypt") {
    // bcrypt_pbkdf is not available in OpenSSL.
    throw std::runtime_error("crypt4gh key: kdf bcrypt is not supported, re-encrypt the key with scrypt");
  }
  throw std::runtime_error("crypt4gh key: unsupported kdf " + std::string(kdf));
}

PrivateKey ParsePrivateKey(std::string_view pem, const std::string& passphrase) {
  const auto blob = Base64Decode(PemBody(pem));
  BlobReader reader(blob);

  if (reader.Take(kMagic.size()) != kMagic) throw std::runtime_error("crypt4gh key: bad magic");

  const auto kdfname = reader.String();
  uint32_t   rounds  = 0;
  std::string_view salt;
  if (kdfname != "none") {
    const auto options = reader.String();
    if (options.size() < 4) throw std::runtime_error("crypt4gh key: bad kdf options");
    rounds = ReadU32Be(options);
    salt   = options.substr(4);
  }

  const auto ciphername   = reader.String();
  const auto private_data = reader.String();

  PrivateKey key;
  if (ciphername == "none") {
    if (private_data.size() != kKeySize) throw std::runtime_error("crypt4gh key: bad key length");
    std::copy(private_data.begin(), private_data.end(), key.secret.begin());
  } else if (ciphername == "chacha20_poly1305") {
    if (kdfname == "none") throw std::runtime_error("crypt4gh key: encrypted key without kdf");
    if (passphrase.empty()) throw std::runtime_error("crypt4gh key: passphrase required");
    if (private_data.size() != kNonceSize + kKeySize + kMacSize) throw std::runtime_error("crypt4gh key: bad key length");

    const auto  wrapping = DeriveKeyFromPassphrase(kdfname, passphrase, salt, rounds);
    const auto* data     = reinterpret_cast<const uint8_t*>(private_data.data());
    if (!ChaChaPolyDecrypt(wrapping, data, data + kNonceSize, private_data.size() - kNonceSize, key.secret.data())) {
      throw std::runtime_error("crypt4gh key: wrong passphrase");
    }
  } else {
    throw std::runtime_error("crypt4gh key: unsupported cipher " + std::string(ciphername));
  }

  key.public_key = X25519PublicKey(key.secret);
  return key;
}

PrivateKey LoadPrivateKey(const std::string& path, const std::string& passphrase) {
  std::ifstream in(path);
  if (!in) throw std::runtime_error("cannot open crypt4gh key " + path);
  std::ostringstream text;
  text << in.rdbuf();
  return ParsePrivateKey(text.str(), passphrase);
}

} // namespace sda::crypt4gh
