#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include "crypto.hpp"

namespace sda::crypt4gh {

struct PrivateKey {
  Key secret{};
  Key public_key{};
};

/*
  Crypt4GH private key file:

      -----BEGIN CRYPT4GH [ENCRYPTED ]PRIVATE KEY-----
      base64( "c4gh-v1" kdfname [kdfoptions] ciphername private_data )
      -----END CRYPT4GH [ENCRYPTED ]PRIVATE KEY-----

  Strings are prefixed by a big-endian u16 length. kdfoptions is a
  big-endian u32 rounds followed by the salt. private_data is
  nonce(12) || chacha20-poly1305(secret) unless ciphername is "none".

  Supported KDFs: none, scrypt, pbkdf2_hmac_sha256. Keys protected with
  bcrypt are refused with a message asking for an scrypt key.

  Throws std::runtime_error naming the problem; a key that cannot be
  loaded is fatal at startup.
*/
PrivateKey LoadPrivateKey(const std::string& path, const std::string& passphrase);

PrivateKey ParsePrivateKey(std::string_view pem, const std::string& passphrase);

Key DeriveKeyFromPassphrase(std::string_view kdf, const std::string& passphrase, std::string_view salt, uint32_t rounds);

std::string Base64Encode(std::string_view bytes);
std::string Base64Decode(std::string_view text);

} // namespace sda::crypt4gh
