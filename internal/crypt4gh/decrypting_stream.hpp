#pragma once

#include <arrow/io/interfaces.h>
#include <arrow/result.h>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <vector>

#include "header.hpp"

namespace sda::crypt4gh {

inline constexpr std::size_t kSegmentSize       = 65536;
inline constexpr std::size_t kCipherSegmentSize = kNonceSize + kSegmentSize + kMacSize;

/*
  Applies a data edit list to consecutive plaintext chunks.

  Lengths alternate skip, keep, skip, keep, ... An odd count keeps
  everything after the last skip; an even count drops everything
  after the last keep.
*/
class EditListFilter {
 public:
  explicit EditListFilter(std::vector<uint64_t> lengths);

  // Compacts the kept bytes of data[0, length) to the front; returns their count.
  std::size_t Apply(uint8_t* data, std::size_t length);

 private:
  void Advance();

  std::vector<uint64_t> lengths_;
  std::size_t           index_     = 0;
  uint64_t              remaining_ = 0;
  bool                  exhausted_ = false;
};

/*
  Crypt4GH decrypting input stream.

  Pull-based: each Read() decrypts at most as many 64 KiB segments as
  needed to satisfy it. Memory use is one ciphertext and one plaintext
  segment regardless of file size.

  Segments after the end of an edit list are still read and
  authenticated, so the source is always consumed to its end.

  Errors:
    DecryptFailure  → malformed header, wrong key, tampered/truncated segment
    anything else   → the source stream's own error
*/
class DecryptingInputStream final : public arrow::io::InputStream {
 public:
  static arrow::Result<std::shared_ptr<DecryptingInputStream>> Open(std::shared_ptr<arrow::io::InputStream> source,
                                                                    const PrivateKey&                       key);

  arrow::Status Close() override;
  bool          closed() const override;

  arrow::Result<int64_t> Tell() const override;

  arrow::Result<int64_t>                        Read(int64_t nbytes, void* out) override;
  arrow::Result<std::shared_ptr<arrow::Buffer>> Read(int64_t nbytes) override;

  int64_t HeaderSize() const {
    return header_size_;
  }

 private:
  DecryptingInputStream(std::shared_ptr<arrow::io::InputStream> source, Header header);

  arrow::Status NextSegment();

  std::shared_ptr<arrow::io::InputStream> source_;
  std::vector<Key>                        session_keys_;
  std::unique_ptr<EditListFilter>         edits_;
  int64_t                                 header_size_ = 0;

  std::vector<uint8_t> cipher_;
  std::vector<uint8_t> plain_;
  std::size_t          plain_pos_ = 0;
  std::size_t          plain_len_ = 0;
  uint64_t             segment_   = 0;

  int64_t position_ = 0;
  bool    eof_      = false;
  bool    closed_   = false;
};

} // namespace sda::crypt4gh
