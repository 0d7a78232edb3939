#include "crypto.hpp"

#include <openssl/evp.h>
#include <openssl/rand.h>

#include <algorithm>
#include <memory>
#include <stdexcept>

namespace sda::crypt4gh {

namespace {

struct PkeyDeleter {
  void operator()(EVP_PKEY* key) const {
    EVP_PKEY_free(key);
  }
};
struct PkeyCtxDeleter {
  void operator()(EVP_PKEY_CTX* ctx) const {
    EVP_PKEY_CTX_free(ctx);
  }
};
struct CipherCtxDeleter {
  void operator()(EVP_CIPHER_CTX* ctx) const {
    EVP_CIPHER_CTX_free(ctx);
  }
};
struct MdCtxDeleter {
  void operator()(EVP_MD_CTX* ctx) const {
    EVP_MD_CTX_free(ctx);
  }
};

using PkeyPtr      = std::unique_ptr<EVP_PKEY, PkeyDeleter>;
using PkeyCtxPtr   = std::unique_ptr<EVP_PKEY_CTX, PkeyCtxDeleter>;
using CipherCtxPtr = std::unique_ptr<EVP_CIPHER_CTX, CipherCtxDeleter>;
using MdCtxPtr     = std::unique_ptr<EVP_MD_CTX, MdCtxDeleter>;

PkeyPtr PrivateKey(const Key& secret_key) {
  PkeyPtr key(EVP_PKEY_new_raw_private_key(EVP_PKEY_X25519, nullptr, secret_key.data(), secret_key.size()));
  if (!key) throw std::runtime_error("invalid X25519 private key");
  return key;
}

/*
  BLAKE2b-512 over (shared || reader_pk || writer_pk), returning bytes 0..31.
  This is libsodium's crypto_kx: the reader's rx key equals the writer's tx key.
*/
Key DeriveSessionKey(const Key& shared, const Key& reader_public, const Key& writer_public) {
  MdCtxPtr ctx(EVP_MD_CTX_new());
  if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_blake2b512(), nullptr) != 1 ||
      EVP_DigestUpdate(ctx.get(), shared.data(), shared.size()) != 1 ||
      EVP_DigestUpdate(ctx.get(), reader_public.data(), reader_public.size()) != 1 ||
      EVP_DigestUpdate(ctx.get(), writer_public.data(), writer_public.size()) != 1) {
    throw std::runtime_error("BLAKE2b-512 failed");
  }

  unsigned char digest[EVP_MAX_MD_SIZE];
  unsigned int  len = 0;
  if (EVP_DigestFinal_ex(ctx.get(), digest, &len) != 1 || len != 64) {
    throw std::runtime_error("BLAKE2b-512 failed");
  }

  Key key{};
  std::copy(digest, digest + kKeySize, key.begin());
  return key;
}

} // namespace

Key X25519PublicKey(const Key& secret_key) {
  auto   key = PrivateKey(secret_key);
  Key    pub{};
  size_t len = pub.size();
  if (EVP_PKEY_get_raw_public_key(key.get(), pub.data(), &len) != 1 || len != pub.size()) {
    throw std::runtime_error("failed to derive X25519 public key");
  }
  return pub;
}

std::optional<Key> X25519(const Key& secret_key, const Key& peer_public_key) {
  auto    key = PrivateKey(secret_key);
  PkeyPtr peer(EVP_PKEY_new_raw_public_key(EVP_PKEY_X25519, nullptr, peer_public_key.data(), peer_public_key.size()));
  if (!peer) return std::nullopt;

  PkeyCtxPtr ctx(EVP_PKEY_CTX_new(key.get(), nullptr));
  if (!ctx || EVP_PKEY_derive_init(ctx.get()) != 1) {
    throw std::runtime_error("X25519 init failed");
  }

  Key    shared{};
  size_t len = shared.size();
  if (EVP_PKEY_derive_set_peer(ctx.get(), peer.get()) != 1 || EVP_PKEY_derive(ctx.get(), shared.data(), &len) != 1 ||
      len != shared.size()) {
    return std::nullopt;
  }
  return shared;
}

std::optional<Key> ReaderSharedKey(const Key& reader_secret, const Key& reader_public, const Key& writer_public) {
  auto shared = X25519(reader_secret, writer_public);
  if (!shared) return std::nullopt;
  return DeriveSessionKey(*shared, reader_public, writer_public);
}

std::optional<Key> WriterSharedKey(const Key& writer_secret, const Key& writer_public, const Key& reader_public) {
  auto shared = X25519(writer_secret, reader_public);
  if (!shared) return std::nullopt;
  return DeriveSessionKey(*shared, reader_public, writer_public);
}

bool ChaChaPolyDecrypt(const Key& key, const uint8_t* nonce, const uint8_t* ciphertext, std::size_t length, uint8_t* out) {
  if (length < kMacSize) return false;
  const auto data_len = static_cast<int>(length - kMacSize);

  CipherCtxPtr ctx(EVP_CIPHER_CTX_new());
  if (!ctx || EVP_DecryptInit_ex(ctx.get(), EVP_chacha20_poly1305(), nullptr, nullptr, nullptr) != 1 ||
      EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_AEAD_SET_IVLEN, static_cast<int>(kNonceSize), nullptr) != 1 ||
      EVP_DecryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), nonce) != 1) {
    throw std::runtime_error("chacha20-poly1305 init failed");
  }

  int len = 0;
  if (data_len > 0 && EVP_DecryptUpdate(ctx.get(), out, &len, ciphertext, data_len) != 1) {
    return false;
  }
  if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_AEAD_SET_TAG, static_cast<int>(kMacSize),
                          const_cast<uint8_t*>(ciphertext + data_len)) != 1) {
    return false;
  }
  int final_len = 0;
  return EVP_DecryptFinal_ex(ctx.get(), out + len, &final_len) > 0;
}

std::string ChaChaPolyEncrypt(const Key& key, const uint8_t* nonce, std::string_view plaintext) {
  CipherCtxPtr ctx(EVP_CIPHER_CTX_new());
  if (!ctx || EVP_EncryptInit_ex(ctx.get(), EVP_chacha20_poly1305(), nullptr, nullptr, nullptr) != 1 ||
      EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_AEAD_SET_IVLEN, static_cast<int>(kNonceSize), nullptr) != 1 ||
      EVP_EncryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), nonce) != 1) {
    throw std::runtime_error("chacha20-poly1305 init failed");
  }

  std::string out(plaintext.size() + kMacSize, '\0');
  auto*       dst = reinterpret_cast<uint8_t*>(out.data());
  int         len = 0;
  if (!plaintext.empty() &&
      EVP_EncryptUpdate(ctx.get(), dst, &len, reinterpret_cast<const uint8_t*>(plaintext.data()),
                        static_cast<int>(plaintext.size())) != 1) {
    throw std::runtime_error("chacha20-poly1305 encrypt failed");
  }
  int final_len = 0;
  if (EVP_EncryptFinal_ex(ctx.get(), dst + len, &final_len) != 1 ||
      EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_AEAD_GET_TAG, static_cast<int>(kMacSize), dst + plaintext.size()) != 1) {
    throw std::runtime_error("chacha20-poly1305 encrypt failed");
  }
  return out;
}

void RandomBytes(uint8_t* out, std::size_t length) {
  if (RAND_bytes(out, static_cast<int>(length)) != 1) {
    throw std::runtime_error("RAND_bytes failed");
  }
}

} // namespace sda::crypt4gh
