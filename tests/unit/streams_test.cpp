#include <arrow/buffer.h>
#include <arrow/io/memory.h>

#include <cassert>
#include <iostream>
#include <memory>
#include <string>

#include "internal/checksum/digest.hpp"
#include "internal/storage/common/arrow_utils.hpp"
#include "internal/stream/concat_input_stream.hpp"
#include "internal/stream/observing_input_stream.hpp"
#include "internal/util/errors.hpp"

namespace {

using sda::checksum::Algorithm;
using sda::checksum::Digest;
using sda::checksum::HexDigestOf;
using sda::storage::common::ReadFully;
using sda::storage::common::Unwrap;
using sda::stream::ConcatInputStream;
using sda::stream::ObservingInputStream;

std::shared_ptr<arrow::io::BufferReader> Source(const std::string& text) {
  return std::make_shared<arrow::io::BufferReader>(arrow::Buffer::FromString(text));
}

void TestKnownDigests() {
  assert(HexDigestOf(Algorithm::kSha256, "") == "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
  assert(HexDigestOf(Algorithm::kMd5, "") == "d41d8cd98f00b204e9800998ecf8427e");
  assert(HexDigestOf(Algorithm::kSha256, "abc") == "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
  assert(HexDigestOf(Algorithm::kMd5, "abc") == "900150983cd24fb0d6963f7d28e17f72");

  assert(sda::checksum::ToString(Algorithm::kSha256) == "sha256");
  assert(sda::checksum::ToString(Algorithm::kMd5) == "md5");
}

void TestIncrementalDigestMatchesOneShot() {
  Digest digest(Algorithm::kSha256);
  digest.Update("a");
  digest.Update("bc");
  const auto hex = digest.HexDigest();
  assert(hex == HexDigestOf(Algorithm::kSha256, "abc"));
  assert(digest.HexDigest() == hex);

  bool threw = false;
  try {
    digest.Update("more");
  } catch (const sda::util::InvalidState&) {
    threw = true;
  }
  assert(threw);
}

void TestObserversSeeEveryByteOnce() {
  const std::string    text(3000, 'q');
  Digest               sha(Algorithm::kSha256);
  Digest               md5(Algorithm::kMd5);
  ObservingInputStream tee(Source(text), {sha.Observer(), md5.Observer()});

  std::string out;
  uint8_t     buffer[700];
  while (true) {
    const auto n = Unwrap(tee.Read(sizeof(buffer), buffer));
    if (n == 0) break;
    out.append(reinterpret_cast<const char*>(buffer), static_cast<size_t>(n));
  }
  // buffer-returning overload observes too
  assert(Unwrap(tee.Read(10))->size() == 0);

  assert(out == text);
  assert(tee.BytesObserved() == 3000);
  assert(*tee.Tell() == 3000);
  assert(sha.HexDigest() == HexDigestOf(Algorithm::kSha256, text));
  assert(md5.HexDigest() == HexDigestOf(Algorithm::kMd5, text));

  assert(tee.Close().ok());
  assert(tee.closed());
}

void TestConcatReadsPartsInOrder() {
  auto              first  = Source("header|");
  auto              second = Source("");
  auto              third  = Source("body bytes");
  ConcatInputStream joined({first, second, third});

  uint8_t    buffer[64];
  const auto n = Unwrap(ReadFully(joined, sizeof(buffer), buffer));
  assert(n == 17);
  assert(std::string(reinterpret_cast<const char*>(buffer), static_cast<size_t>(n)) == "header|body bytes");
  assert(*joined.Tell() == 17);

  // a single read fills across part boundaries
  ConcatInputStream again({Source("ab"), Source("cd"), Source("ef")});
  auto              chunk = Unwrap(again.Read(3));
  assert(chunk->ToString() == "abc");
  chunk = Unwrap(again.Read(8));
  assert(chunk->ToString() == "def");
  assert(Unwrap(again.Read(4))->size() == 0);

  assert(joined.Close().ok());
  assert(joined.closed());
  assert(first->closed() && second->closed() && third->closed());
}

void TestConcatOfObservedBody() {
  const std::string header = "HDR";
  const std::string body   = "encrypted payload";

  Digest            body_sha(Algorithm::kSha256);
  auto              observed = std::make_shared<ObservingInputStream>(Source(body), std::vector<ObservingInputStream::Observer>{body_sha.Observer()});
  ConcatInputStream joined({Source(header), observed});

  uint8_t buffer[64];
  assert(Unwrap(ReadFully(joined, sizeof(buffer), buffer)) == static_cast<int64_t>(header.size() + body.size()));

  // only the body is hashed, not the prefixed header
  assert(body_sha.HexDigest() == HexDigestOf(Algorithm::kSha256, body));
  assert(observed->BytesObserved() == static_cast<int64_t>(body.size()));
}

} // namespace

int main() {
  TestKnownDigests();
  TestIncrementalDigestMatchesOneShot();
  TestObserversSeeEveryByteOnce();
  TestConcatReadsPartsInOrder();
  TestConcatOfObservedBody();

  std::cout << "sda_unit_streams: pass\n";
  return 0;
}
