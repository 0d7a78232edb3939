#pragma once

#include <cstddef>
#include <cstdint>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <string>

namespace sda::testing {

/*
  Files committed under tests/data. Produced by
  tests/data/crypt4gh/make_fixture.py with libsodium, independently of
  the crypt4gh sources; expected.txt beside them lists the values below.
*/
inline std::string FixturePath(const std::string& relative) {
  return std::string(SDA_TEST_DATA_DIR) + "/" + relative;
}

inline std::string ReadFixture(const std::string& relative) {
  std::ifstream in(FixturePath(relative), std::ios::binary);
  if (!in) throw std::runtime_error("missing fixture " + relative);
  return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

namespace reference {

inline constexpr const char* kKeyFile    = "crypt4gh/reader.sec";
inline constexpr const char* kPublicFile = "crypt4gh/reader.pub";
inline constexpr const char* kFile       = "crypt4gh/sample.c4gh";
inline constexpr const char* kPassphrase = "fixture-passphrase";

inline constexpr std::size_t kHeaderSize    = 232;
inline constexpr int64_t     kBodySize      = 100056;
inline constexpr int64_t     kPlaintextSize = 100000;

inline constexpr const char* kBodySha256      = "7cf3cc62c28e0128ecd5aaded93c6f917405d1ee717faf49f1e5cc274ca3426e";
inline constexpr const char* kPlaintextSha256 = "fe714630fc4344e3ac6a31bd05f171274b4ca93973cc97c6287a1342e9dccdc7";
inline constexpr const char* kPlaintextMd5    = "8e628ab408fe4c107b1f0571f5212dc9";

} // namespace reference

} // namespace sda::testing
