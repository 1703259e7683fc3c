#pragma once

#include <cstdint>
#include <span>
#include <string>

namespace pgvec::util {

// Lowercase hex, two digits per byte, no separators.
inline std::string to_hex(std::span<const std::uint8_t> bytes) {
  static constexpr char digits[] = "0123456789abcdef";
  std::string out;
  out.reserve(bytes.size() * 2);
  for (auto b : bytes) {
    out.push_back(digits[b >> 4]);
    out.push_back(digits[b & 0x0F]);
  }
  return out;
}

} // namespace pgvec::util
