#pragma once

#include <arrow/io/interfaces.h>
#include <arrow/result.h>
#include <arrow/status.h>

#include <cstdint>
#include <utility>

#include "internal/util/errors.hpp"

namespace sda::storage::common {

// Streams move data in 1 MiB reads; never a whole file.
inline constexpr int64_t kDefaultCopyChunk = 1 << 20;

/*
  Helper: unwrap Arrow Result<T> or throw TransientIOError
*/
template <typename T>
T Unwrap(arrow::Result<T> result) {
  if (!result.ok()) throw util::TransientIOError(result.status().ToString());
  return std::move(result).ValueOrDie();
}

inline void Unwrap(const arrow::Status& status) {
  if (!status.ok()) throw util::TransientIOError(status.ToString());
}

/*
  Read until nbytes are read or the stream is exhausted.
  Returns the number of bytes read (short only at end of stream).
*/
arrow::Result<int64_t> ReadFully(arrow::io::InputStream& in, int64_t nbytes, uint8_t* out);

/*
  Stream everything from in to out in chunk_size reads.
  Does not close either stream. Returns bytes copied.
*/
arrow::Result<int64_t> CopyStream(arrow::io::InputStream& in, arrow::io::OutputStream& out,
                                  int64_t chunk_size = kDefaultCopyChunk);

} // namespace sda::storage::common
