#pragma once

#include <arrow/io/interfaces.h>
#include <arrow/result.h>

#include <cstdint>
#include <optional>
#include <vector>

#include "key_file.hpp"

namespace sda::crypt4gh {

inline constexpr uint32_t kVersion = 1;

// Decrypted header packet types.
inline constexpr uint32_t kPacketDataEncryptionParameters = 0;
inline constexpr uint32_t kPacketDataEditList             = 1;

// Header packet / body encryption methods.
inline constexpr uint32_t kMethodX25519ChaChaPoly = 0;
inline constexpr uint32_t kMethodChaChaPoly       = 0;

struct Header {
  // Every data key found in packets addressed to this reader.
  std::vector<Key> session_keys;
  // Alternating skip/keep lengths over the plaintext.
  std::optional<std::vector<uint64_t>> edit_list;
  // Bytes consumed from the stream.
  int64_t size = 0;
};

/*
  Reads the Crypt4GH header from the front of the stream and leaves the
  stream positioned at the first body segment.

  Layout (little endian):
      "crypt4gh" | u32 version | u32 packet_count
      packet*: u32 length (incl. itself) | u32 method | writer_pk(32) | nonce(12) | ciphertext+tag

  Packets that do not decrypt with this key are addressed to another
  reader and skipped. Fails with DecryptFailure when the header is
  malformed or no data key is addressed to this reader.
*/
arrow::Result<Header> ReadHeader(arrow::io::InputStream& in, const PrivateKey& key);

} // namespace sda::crypt4gh
