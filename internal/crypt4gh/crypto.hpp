#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace sda::crypt4gh {

inline constexpr std::size_t kKeySize   = 32;
inline constexpr std::size_t kNonceSize = 12;
inline constexpr std::size_t kMacSize   = 16;

using Key   = std::array<uint8_t, kKeySize>;
using Nonce = std::array<uint8_t, kNonceSize>;

/*
  Thin OpenSSL EVP wrappers for the primitives Crypt4GH is built on.
  Failures of the library itself throw std::runtime_error; an
  authentication failure is a normal false return.
*/

Key X25519PublicKey(const Key& secret_key);
// nullopt when the peer key is invalid (low order point).
std::optional<Key> X25519(const Key& secret_key, const Key& peer_public_key);

/*
  Key shared between a header packet's writer and this reader:

      BLAKE2b-512(X25519(reader_sk, writer_pk) || reader_pk || writer_pk)[0:32]

  which is crypto_kx client rx on the reader side and server tx on the
  writer side.
*/
std::optional<Key> ReaderSharedKey(const Key& reader_secret, const Key& reader_public, const Key& writer_public);
std::optional<Key> WriterSharedKey(const Key& writer_secret, const Key& writer_public, const Key& reader_public);

// ChaCha20-Poly1305 (IETF). ciphertext is data || 16 byte tag.
bool ChaChaPolyDecrypt(const Key& key, const uint8_t* nonce, const uint8_t* ciphertext, std::size_t length, uint8_t* out);

std::string ChaChaPolyEncrypt(const Key& key, const uint8_t* nonce, std::string_view plaintext);

void RandomBytes(uint8_t* out, std::size_t length);

} // namespace sda::crypt4gh
