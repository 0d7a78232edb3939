#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "internal/crypt4gh/key_file.hpp"

namespace sda::testing {

struct EncryptedFile {
  std::string header;
  std::string body;

  std::string Whole() const {
    return header + body;
  }
};

struct EncryptOptions {
  std::optional<std::vector<uint64_t>> edit_list;
  // Adds a session key packet addressed to this reader before ours.
  std::optional<crypt4gh::Key> other_reader;
};

crypt4gh::PrivateKey GenerateKey();

// Crypt4GH v1 encryption of plaintext to reader_public.
EncryptedFile Encrypt(const std::string& plaintext, const crypt4gh::Key& reader_public, const EncryptOptions& options = {});

// PEM private key file; kdf "none" writes the key unencrypted.
std::string PrivateKeyPem(const crypt4gh::PrivateKey& key, const std::string& passphrase, const std::string& kdf = "scrypt");

} // namespace sda::testing
