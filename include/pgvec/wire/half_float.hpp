#pragma once

/** \file half_float.hpp
 *  \brief IEEE 754 binary16 conversion (half precision).
 *
 * Narrowing rounds to nearest, ties to even, directly from double so there is no
 * double rounding through float32. Subnormals are produced and consumed; NaN stays NaN
 * and infinities stay infinite. A finite value that rounds beyond 65504 is out_of_range.
 */

#include <cstdint>
#include <expected>

#include "pgvec/error.hpp"

namespace pgvec::wire {

inline constexpr double kHalfMax = 65504.0;

auto double_to_half_bits(double v) -> std::expected<std::uint16_t, core::error>;

// Every binary16 value is exactly representable as float32.
auto half_bits_to_float(std::uint16_t bits) noexcept -> float;

} // namespace pgvec::wire
