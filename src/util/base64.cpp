#include "pgvec/util/base64.hpp"

#include <array>
#include <string>

namespace pgvec::util {

static constexpr std::uint8_t kInvalid = 0xFF;

static constexpr std::array<std::uint8_t, 256> DECODE_TABLE = []{
  std::array<std::uint8_t, 256> t{};
  t.fill(kInvalid);
  constexpr char alphabet[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
  for (std::uint8_t i = 0; i < 64; ++i) {
    t[static_cast<unsigned char>(alphabet[i])] = i;
  }
  return t;
}();

static auto is_space(char c) noexcept -> bool {
  return c == ' ' || c == '\n' || c == '\r' || c == '\t' || c == '\v' || c == '\f';
}

static auto fail(std::string msg) -> std::unexpected<core::error> {
  return std::unexpected(core::error{core::error_code::format_error, std::move(msg), "util.base64"});
}

auto base64_decode(std::string_view text) -> std::expected<std::vector<std::uint8_t>, core::error> {
  std::string compact;
  compact.reserve(text.size());
  for (char c : text) {
    if (!is_space(c)) compact.push_back(c);
  }
  if (compact.size() % 4 != 0) return fail("incorrect padding");

  std::vector<std::uint8_t> out;
  out.reserve(compact.size() / 4 * 3);
  for (std::size_t i = 0; i < compact.size(); i += 4) {
    const bool last = (i + 4 == compact.size());
    std::uint32_t acc = 0;
    int pad = 0;
    for (std::size_t k = 0; k < 4; ++k) {
      const char c = compact[i + k];
      if (c == '=') {
        // padding only in the final quantum, only in its last two positions, and only trailing
        if (!last || k < 2) return fail("misplaced padding");
        ++pad;
        acc <<= 6;
        continue;
      }
      if (pad > 0) return fail("misplaced padding");
      const std::uint8_t v = DECODE_TABLE[static_cast<unsigned char>(c)];
      if (v == kInvalid) return fail("invalid base64 character at offset " + std::to_string(i + k));
      acc = (acc << 6) | v;
    }
    out.push_back(static_cast<std::uint8_t>(acc >> 16));
    if (pad < 2) out.push_back(static_cast<std::uint8_t>(acc >> 8));
    if (pad < 1) out.push_back(static_cast<std::uint8_t>(acc));
  }
  return out;
}

} // namespace pgvec::util
