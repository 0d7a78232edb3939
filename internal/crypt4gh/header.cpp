#include "header.hpp"

#include <cstring>
#include <string>

#include "decrypt_status.hpp"
#include "internal/storage/common/arrow_utils.hpp"

namespace sda::crypt4gh {

namespace {

constexpr char     kMagic[8]           = {'c', 'r', 'y', 'p', 't', '4', 'g', 'h'};
constexpr uint32_t kMaxPackets         = 1024;
constexpr uint32_t kMaxPacketSize      = 1 << 20;
constexpr uint32_t kMinEncryptedPacket = 4 + 4 + kKeySize + kNonceSize + kMacSize;

uint32_t LoadU32(const uint8_t* p) {
  return static_cast<uint32_t>(p[0]) | (static_cast<uint32_t>(p[1]) << 8) | (static_cast<uint32_t>(p[2]) << 16) |
         (static_cast<uint32_t>(p[3]) << 24);
}

uint64_t LoadU64(const uint8_t* p) {
  return static_cast<uint64_t>(LoadU32(p)) | (static_cast<uint64_t>(LoadU32(p + 4)) << 32);
}

arrow::Status ReadExact(arrow::io::InputStream& in, int64_t n, uint8_t* out, const char* what) {
  ARROW_ASSIGN_OR_RAISE(auto got, storage::common::ReadFully(in, n, out));
  if (got != n) return DecryptFailure(std::string("crypt4gh header truncated in ") + what);
  return arrow::Status::OK();
}

/*
  Interprets one decrypted packet body.
*/
arrow::Status ApplyPacket(const std::vector<uint8_t>& plain, Header* header) {
  if (plain.size() < 4) return DecryptFailure("crypt4gh header packet too short");
  const uint32_t type = LoadU32(plain.data());

  if (type == kPacketDataEncryptionParameters) {
    if (plain.size() != 4 + 4 + kKeySize) return DecryptFailure("crypt4gh data encryption packet has bad length");
    if (LoadU32(plain.data() + 4) != kMethodChaChaPoly) return DecryptFailure("crypt4gh unsupported data encryption method");
    Key session{};
    std::memcpy(session.data(), plain.data() + 8, kKeySize);
    header->session_keys.push_back(session);
    return arrow::Status::OK();
  }

  if (type == kPacketDataEditList) {
    if (header->edit_list) return DecryptFailure("crypt4gh header has more than one edit list");
    if (plain.size() < 8) return DecryptFailure("crypt4gh edit list packet too short");
    const uint32_t count = LoadU32(plain.data() + 4);
    if (plain.size() != 8 + static_cast<std::size_t>(count) * 8) return DecryptFailure("crypt4gh edit list packet has bad length");

    std::vector<uint64_t> lengths;
    lengths.reserve(count);
    for (uint32_t i = 0; i < count; ++i) {
      lengths.push_back(LoadU64(plain.data() + 8 + i * 8));
    }
    header->edit_list = std::move(lengths);
    return arrow::Status::OK();
  }

  // Unknown packet types are reserved for extensions.
  return arrow::Status::OK();
}

} // namespace

arrow::Result<Header> ReadHeader(arrow::io::InputStream& in, const PrivateKey& key) {
  Header  header;
  uint8_t preamble[16];
  ARROW_RETURN_NOT_OK(ReadExact(in, sizeof(preamble), preamble, "preamble"));
  header.size += sizeof(preamble);

  if (std::memcmp(preamble, kMagic, sizeof(kMagic)) != 0) return DecryptFailure("not a crypt4gh stream");
  if (LoadU32(preamble + 8) != kVersion) return DecryptFailure("unsupported crypt4gh version");

  const uint32_t packet_count = LoadU32(preamble + 12);
  if (packet_count == 0 || packet_count > kMaxPackets) return DecryptFailure("crypt4gh header has invalid packet count");

  std::vector<uint8_t> packet;
  std::vector<uint8_t> plain;
  for (uint32_t i = 0; i < packet_count; ++i) {
    uint8_t length_bytes[4];
    ARROW_RETURN_NOT_OK(ReadExact(in, 4, length_bytes, "packet length"));
    const uint32_t length = LoadU32(length_bytes);
    if (length < 8 || length > kMaxPacketSize) return DecryptFailure("crypt4gh header packet has invalid length");

    packet.resize(length - 4);
    ARROW_RETURN_NOT_OK(ReadExact(in, length - 4, packet.data(), "packet"));
    header.size += length;

    if (LoadU32(packet.data()) != kMethodX25519ChaChaPoly || length < kMinEncryptedPacket) continue;

    Key writer_public{};
    std::memcpy(writer_public.data(), packet.data() + 4, kKeySize);
    const uint8_t* nonce      = packet.data() + 4 + kKeySize;
    const uint8_t* ciphertext = nonce + kNonceSize;
    const auto     ct_len     = packet.size() - 4 - kKeySize - kNonceSize;

    const auto shared = ReaderSharedKey(key.secret, key.public_key, writer_public);
    plain.resize(ct_len - kMacSize);
    if (!shared || !ChaChaPolyDecrypt(*shared, nonce, ciphertext, ct_len, plain.data())) {
      continue;
    }
    ARROW_RETURN_NOT_OK(ApplyPacket(plain, &header));
  }

  if (header.session_keys.empty()) return DecryptFailure("no crypt4gh header packet decrypts with this key");
  return header;
}

} // namespace sda::crypt4gh
