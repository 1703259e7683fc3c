#include "pgvec/wire/half_float.hpp"

#include <bit>

namespace pgvec::wire {

namespace {

constexpr int kDoubleMantBits = 52;
constexpr int kHalfMantBits = 10;
constexpr std::uint64_t kDoubleMantMask = (std::uint64_t{1} << kDoubleMantBits) - 1;

// Shift \p sig right by \p shift bits rounding to nearest, ties to even.
auto round_shift(std::uint64_t sig, int shift) noexcept -> std::uint64_t {
  if (shift <= 0) return sig;
  if (shift >= 64) return 0;
  const std::uint64_t q = sig >> shift;
  const std::uint64_t rem = sig & ((std::uint64_t{1} << shift) - 1);
  const std::uint64_t halfway = std::uint64_t{1} << (shift - 1);
  if (rem > halfway || (rem == halfway && (q & 1u))) return q + 1;
  return q;
}

auto overflow() -> core::error {
  return core::error{core::error_code::out_of_range, "value too large for float16", "wire.half"};
}

} // namespace

auto double_to_half_bits(double v) -> std::expected<std::uint16_t, core::error> {
  const auto bits = std::bit_cast<std::uint64_t>(v);
  const auto sign = static_cast<std::uint16_t>((bits >> 48) & 0x8000u);
  const int exp = static_cast<int>((bits >> kDoubleMantBits) & 0x7FFu);
  const std::uint64_t mant = bits & kDoubleMantMask;

  if (exp == 0x7FF) {
    if (mant == 0) return static_cast<std::uint16_t>(sign | 0x7C00u);
    // keep the top payload bits, force quiet so the result is never mistaken for infinity
    const auto payload = static_cast<std::uint16_t>(mant >> (kDoubleMantBits - kHalfMantBits));
    return static_cast<std::uint16_t>(sign | 0x7C00u | 0x0200u | payload);
  }
  if (exp == 0) {
    // zero or double subnormal: far below the smallest half subnormal
    return sign;
  }

  const int e = exp - 1023;
  if (e > 15) return std::unexpected(overflow());

  if (e >= -14) {
    std::uint64_t q = round_shift(mant, kDoubleMantBits - kHalfMantBits);
    int half_exp = e + 15;
    if (q == (std::uint64_t{1} << kHalfMantBits)) {
      q = 0;
      ++half_exp;
    }
    if (half_exp >= 31) return std::unexpected(overflow());
    return static_cast<std::uint16_t>(sign | (half_exp << kHalfMantBits) | q);
  }

  // Half subnormal: value / 2^-24 == sig * 2^(e - 28).
  const std::uint64_t sig = mant | (std::uint64_t{1} << kDoubleMantBits);
  const std::uint64_t q = round_shift(sig, 28 - e);
  // q == 0x400 rolls over into the smallest normal, which has the same bit pattern
  return static_cast<std::uint16_t>(sign | q);
}

auto half_bits_to_float(std::uint16_t h) noexcept -> float {
  const std::uint32_t sign = std::uint32_t{h & 0x8000u} << 16;
  std::uint32_t exp = (h >> kHalfMantBits) & 0x1Fu;
  std::uint32_t mant = h & 0x3FFu;

  std::uint32_t out;
  if (exp == 0) {
    if (mant == 0) {
      out = sign;
    } else {
      // normalise the subnormal
      exp = 1;
      while ((mant & 0x400u) == 0) {
        mant <<= 1;
        --exp;
      }
      mant &= 0x3FFu;
      out = sign | ((exp + 127 - 15) << 23) | (mant << 13);
    }
  } else if (exp == 31) {
    out = sign | 0x7F800000u | (mant << 13);
  } else {
    out = sign | ((exp + 127 - 15) << 23) | (mant << 13);
  }
  return std::bit_cast<float>(out);
}

} // namespace pgvec::wire
