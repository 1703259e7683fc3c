#pragma once

/** \file byte_order.hpp
 *  \brief Big-endian packing primitives shared by every vector kind.
 *
 * Endianness: all multi-byte fields are big-endian (network order) on all platforms.
 * Thread-safety: functions are stateless and thread-safe.
 * Errors: bulk unpackers return std::expected with pgvec::core::error (format_error on a
 *         buffer whose length is not a whole number of items).
 */

#include <bit>
#include <cstdint>
#include <expected>
#include <span>
#include <vector>

#include "pgvec/error.hpp"

namespace pgvec::wire {

inline void store_be16(std::uint8_t* p, std::uint16_t v) noexcept {
  p[0] = static_cast<std::uint8_t>(v >> 8);
  p[1] = static_cast<std::uint8_t>(v);
}

inline void store_be32(std::uint8_t* p, std::uint32_t v) noexcept {
  p[0] = static_cast<std::uint8_t>(v >> 24);
  p[1] = static_cast<std::uint8_t>(v >> 16);
  p[2] = static_cast<std::uint8_t>(v >> 8);
  p[3] = static_cast<std::uint8_t>(v);
}

inline auto load_be16(const std::uint8_t* p) noexcept -> std::uint16_t {
  return static_cast<std::uint16_t>((std::uint16_t{p[0]} << 8) | std::uint16_t{p[1]});
}

inline auto load_be32(const std::uint8_t* p) noexcept -> std::uint32_t {
  return (std::uint32_t{p[0]} << 24) | (std::uint32_t{p[1]} << 16) |
         (std::uint32_t{p[2]} << 8) | std::uint32_t{p[3]};
}

inline void store_be_i32(std::uint8_t* p, std::int32_t v) noexcept { store_be32(p, std::bit_cast<std::uint32_t>(v)); }
inline auto load_be_i32(const std::uint8_t* p) noexcept -> std::int32_t { return std::bit_cast<std::int32_t>(load_be32(p)); }

inline void store_be_f32(std::uint8_t* p, float v) noexcept { store_be32(p, std::bit_cast<std::uint32_t>(v)); }
inline auto load_be_f32(const std::uint8_t* p) noexcept -> float { return std::bit_cast<float>(load_be32(p)); }

// Narrow a double to float32. NaN and infinities pass through; a finite value whose
// magnitude exceeds FLT_MAX is out_of_range.
auto narrow_to_f32(double v) -> std::expected<float, core::error>;

// Pack floats as consecutive big-endian float32 items.
auto pack_be_f32(std::span<const float> values) -> std::vector<std::uint8_t>;

// Pack int32 values as consecutive big-endian items.
auto pack_be_i32(std::span<const std::int32_t> values) -> std::vector<std::uint8_t>;

// Unpack a buffer of big-endian float32 items; size must be a multiple of 4.
auto unpack_be_f32(std::span<const std::uint8_t> bytes) -> std::expected<std::vector<float>, core::error>;

// Unpack a buffer of big-endian int32 items; size must be a multiple of 4.
auto unpack_be_i32(std::span<const std::uint8_t> bytes) -> std::expected<std::vector<std::int32_t>, core::error>;

// Unpack a buffer of big-endian float16 items (widened to float); size must be a multiple of 2.
auto unpack_be_f16(std::span<const std::uint8_t> bytes) -> std::expected<std::vector<float>, core::error>;

// Reinterpret a buffer as host-native float32 items; size must be a multiple of 4.
auto unpack_native_f32(std::span<const std::uint8_t> bytes) -> std::expected<std::vector<float>, core::error>;

} // namespace pgvec::wire
