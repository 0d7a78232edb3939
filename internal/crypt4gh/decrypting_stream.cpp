#include "decrypting_stream.hpp"

#include <arrow/buffer.h>

#include <algorithm>
#include <cstring>
#include <string>

#include "decrypt_status.hpp"
#include "internal/storage/common/arrow_utils.hpp"

namespace sda::crypt4gh {

EditListFilter::EditListFilter(std::vector<uint64_t> lengths) : lengths_(std::move(lengths)) {
  if (lengths_.empty()) {
    exhausted_ = true;
    return;
  }
  remaining_ = lengths_[0];
  if (remaining_ == 0) Advance();
}

void EditListFilter::Advance() {
  while (!exhausted_ && remaining_ == 0) {
    if (++index_ >= lengths_.size()) {
      exhausted_ = true;
      return;
    }
    remaining_ = lengths_[index_];
  }
}

std::size_t EditListFilter::Apply(uint8_t* data, std::size_t length) {
  std::size_t kept = 0;
  std::size_t pos  = 0;

  while (pos < length) {
    if (exhausted_) {
      if (lengths_.size() % 2 == 1) {
        std::memmove(data + kept, data + pos, length - pos);
        kept += length - pos;
      }
      break;
    }

    const auto take = static_cast<std::size_t>(std::min<uint64_t>(remaining_, length - pos));
    // Odd indices are keep runs.
    if (index_ % 2 == 1) {
      std::memmove(data + kept, data + pos, take);
      kept += take;
    }
    pos += take;
    remaining_ -= take;
    Advance();
  }
  return kept;
}

DecryptingInputStream::DecryptingInputStream(std::shared_ptr<arrow::io::InputStream> source, Header header)
    : source_(std::move(source)),
      session_keys_(std::move(header.session_keys)),
      header_size_(header.size),
      cipher_(kCipherSegmentSize),
      plain_(kSegmentSize) {
  if (header.edit_list) {
    edits_ = std::make_unique<EditListFilter>(std::move(*header.edit_list));
  }
}

arrow::Result<std::shared_ptr<DecryptingInputStream>> DecryptingInputStream::Open(std::shared_ptr<arrow::io::InputStream> source,
                                                                                  const PrivateKey&                       key) {
  ARROW_ASSIGN_OR_RAISE(auto header, ReadHeader(*source, key));
  return std::shared_ptr<DecryptingInputStream>(new DecryptingInputStream(std::move(source), std::move(header)));
}

arrow::Status DecryptingInputStream::Close() {
  if (closed_) return arrow::Status::OK();
  closed_ = true;
  return source_->Close();
}

bool DecryptingInputStream::closed() const {
  return closed_;
}

arrow::Result<int64_t> DecryptingInputStream::Tell() const {
  if (closed_) return arrow::Status::Invalid("stream is closed");
  return position_;
}

/*
  Segment layout: nonce(12) || ciphertext(<= 64 KiB) || tag(16).
  Only the last segment may be short.
*/
arrow::Status DecryptingInputStream::NextSegment() {
  ARROW_ASSIGN_OR_RAISE(auto n, storage::common::ReadFully(*source_, static_cast<int64_t>(cipher_.size()), cipher_.data()));
  if (n == 0) {
    eof_ = true;
    return arrow::Status::OK();
  }
  if (static_cast<std::size_t>(n) <= kNonceSize + kMacSize) {
    return DecryptFailure("crypt4gh segment " + std::to_string(segment_) + " truncated");
  }

  const auto ct_len = static_cast<std::size_t>(n) - kNonceSize;
  bool       opened = false;
  for (const auto& session_key : session_keys_) {
    if (ChaChaPolyDecrypt(session_key, cipher_.data(), cipher_.data() + kNonceSize, ct_len, plain_.data())) {
      opened = true;
      break;
    }
  }
  if (!opened) {
    return DecryptFailure("crypt4gh segment " + std::to_string(segment_) + " failed authentication");
  }
  ++segment_;

  plain_pos_ = 0;
  plain_len_ = ct_len - kMacSize;
  if (edits_) plain_len_ = edits_->Apply(plain_.data(), plain_len_);
  return arrow::Status::OK();
}

arrow::Result<int64_t> DecryptingInputStream::Read(int64_t nbytes, void* out) {
  if (closed_) return arrow::Status::Invalid("stream is closed");

  auto*   dst   = static_cast<uint8_t*>(out);
  int64_t total = 0;
  while (total < nbytes) {
    if (plain_pos_ < plain_len_) {
      const auto n = std::min<std::size_t>(plain_len_ - plain_pos_, static_cast<std::size_t>(nbytes - total));
      std::memcpy(dst + total, plain_.data() + plain_pos_, n);
      plain_pos_ += n;
      total += static_cast<int64_t>(n);
      continue;
    }
    if (eof_) break;
    ARROW_RETURN_NOT_OK(NextSegment());
  }
  position_ += total;
  return total;
}

arrow::Result<std::shared_ptr<arrow::Buffer>> DecryptingInputStream::Read(int64_t nbytes) {
  ARROW_ASSIGN_OR_RAISE(auto buffer, arrow::AllocateResizableBuffer(nbytes));
  ARROW_ASSIGN_OR_RAISE(auto n, Read(nbytes, buffer->mutable_data()));
  ARROW_RETURN_NOT_OK(buffer->Resize(n, false));
  return std::shared_ptr<arrow::Buffer>(std::move(buffer));
}

} // namespace sda::crypt4gh
