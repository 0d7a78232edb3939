#include "arrow_utils.hpp"

#include <arrow/buffer.h>

namespace sda::storage::common {

arrow::Result<int64_t> ReadFully(arrow::io::InputStream& in, int64_t nbytes, uint8_t* out) {
  int64_t total = 0;
  while (total < nbytes) {
    ARROW_ASSIGN_OR_RAISE(auto n, in.Read(nbytes - total, out + total));
    if (n == 0) break;
    total += n;
  }
  return total;
}

arrow::Result<int64_t> CopyStream(arrow::io::InputStream& in, arrow::io::OutputStream& out, int64_t chunk_size) {
  int64_t copied = 0;
  for (;;) {
    ARROW_ASSIGN_OR_RAISE(auto buffer, in.Read(chunk_size));
    if (buffer->size() == 0) break;
    ARROW_RETURN_NOT_OK(out.Write(buffer));
    copied += buffer->size();
  }
  return copied;
}

} // namespace sda::storage::common
