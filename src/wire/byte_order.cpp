#include "pgvec/wire/byte_order.hpp"

#include <cmath>
#include <cstring>
#include <string>

#include "pgvec/wire/half_float.hpp"

namespace pgvec::wire {

static auto length_error(std::size_t size, std::size_t width) -> core::error {
  return core::error{core::error_code::format_error,
                     "buffer of " + std::to_string(size) + " bytes is not a multiple of " +
                         std::to_string(width),
                     "wire.bytes"};
}

auto narrow_to_f32(double v) -> std::expected<float, core::error> {
  // range is checked after rounding: values within half an ulp of FLT_MAX narrow to FLT_MAX
  const float f = static_cast<float>(v);
  if (std::isinf(f) && std::isfinite(v)) {
    return std::unexpected(core::error{core::error_code::out_of_range, "value too large for float32", "wire.bytes"});
  }
  return f;
}

auto pack_be_f32(std::span<const float> values) -> std::vector<std::uint8_t> {
  std::vector<std::uint8_t> out(values.size() * 4);
  std::uint8_t* p = out.data();
  for (float v : values) { store_be_f32(p, v); p += 4; }
  return out;
}

auto pack_be_i32(std::span<const std::int32_t> values) -> std::vector<std::uint8_t> {
  std::vector<std::uint8_t> out(values.size() * 4);
  std::uint8_t* p = out.data();
  for (std::int32_t v : values) { store_be_i32(p, v); p += 4; }
  return out;
}

auto unpack_be_f32(std::span<const std::uint8_t> bytes) -> std::expected<std::vector<float>, core::error> {
  if (bytes.size() % 4 != 0) return std::unexpected(length_error(bytes.size(), 4));
  std::vector<float> out(bytes.size() / 4);
  for (std::size_t i = 0; i < out.size(); ++i) out[i] = load_be_f32(bytes.data() + i * 4);
  return out;
}

auto unpack_be_i32(std::span<const std::uint8_t> bytes) -> std::expected<std::vector<std::int32_t>, core::error> {
  if (bytes.size() % 4 != 0) return std::unexpected(length_error(bytes.size(), 4));
  std::vector<std::int32_t> out(bytes.size() / 4);
  for (std::size_t i = 0; i < out.size(); ++i) out[i] = load_be_i32(bytes.data() + i * 4);
  return out;
}

auto unpack_be_f16(std::span<const std::uint8_t> bytes) -> std::expected<std::vector<float>, core::error> {
  if (bytes.size() % 2 != 0) return std::unexpected(length_error(bytes.size(), 2));
  std::vector<float> out(bytes.size() / 2);
  for (std::size_t i = 0; i < out.size(); ++i) out[i] = half_bits_to_float(load_be16(bytes.data() + i * 2));
  return out;
}

auto unpack_native_f32(std::span<const std::uint8_t> bytes) -> std::expected<std::vector<float>, core::error> {
  if (bytes.size() % 4 != 0) return std::unexpected(length_error(bytes.size(), 4));
  std::vector<float> out(bytes.size() / 4);
  if (!out.empty()) std::memcpy(out.data(), bytes.data(), bytes.size());
  return out;
}

} // namespace pgvec::wire
