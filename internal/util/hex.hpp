#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace sda::util {

std::string HexEncode(const std::uint8_t* data, std::size_t size);

inline std::string HexEncode(std::string_view bytes) {
  return HexEncode(reinterpret_cast<const std::uint8_t*>(bytes.data()), bytes.size());
}

// Throws std::invalid_argument on odd length or non-hex characters.
std::string HexDecode(std::string_view hex);

bool IsLowerHex(std::string_view value);

} // namespace sda::util
