#include "pgvec/vector/dense_vector.hpp"

#include <algorithm>
#include <string>
#include <type_traits>

#include "pgvec/util/base64.hpp"
#include "pgvec/util/hex.hpp"
#include "pgvec/vector/float_base64.hpp"
#include "pgvec/wire/byte_order.hpp"
#include "pgvec/wire/half_float.hpp"

namespace pgvec {

auto Float32Item::store(std::uint8_t* p, double v) -> std::expected<void, core::error> {
  auto f = wire::narrow_to_f32(v);
  if (!f) return std::unexpected(f.error());
  wire::store_be_f32(p, *f);
  return {};
}

auto Float32Item::load(const std::uint8_t* p) noexcept -> double {
  return static_cast<double>(wire::load_be_f32(p));
}

auto Float16Item::store(std::uint8_t* p, double v) -> std::expected<void, core::error> {
  auto h = wire::double_to_half_bits(v);
  if (!h) return std::unexpected(h.error());
  wire::store_be16(p, *h);
  return {};
}

auto Float16Item::load(const std::uint8_t* p) noexcept -> double {
  return static_cast<double>(wire::half_bits_to_float(wire::load_be16(p)));
}

template <typename Item>
auto DenseVector<Item>::from_item_bytes(std::vector<std::uint8_t> data)
    -> std::expected<DenseVector, core::error> {
  if (data.size() % bytes_per_item != 0) {
    return std::unexpected(core::error{core::error_code::format_error,
                                       "item buffer of " + std::to_string(data.size()) +
                                           " bytes is not a multiple of " + std::to_string(bytes_per_item),
                                       "vector.dense"});
  }
  if (data.size() / bytes_per_item > max_dim) {
    return std::unexpected(core::error{core::error_code::out_of_range,
                                       "dimension " + std::to_string(data.size() / bytes_per_item) +
                                           " exceeds " + std::to_string(max_dim),
                                       "vector.dense"});
  }
  return DenseVector(std::move(data));
}

template <typename Item>
auto DenseVector<Item>::from_float_list(std::span<const double> values)
    -> std::expected<DenseVector, core::error> {
  if (values.size() > max_dim) {
    return std::unexpected(core::error{core::error_code::out_of_range,
                                       "dimension " + std::to_string(values.size()) + " exceeds " +
                                           std::to_string(max_dim),
                                       "vector.dense"});
  }
  std::vector<std::uint8_t> data(values.size() * bytes_per_item);
  std::uint8_t* p = data.data();
  for (double v : values) {
    if (auto r = Item::store(p, v); !r) return std::unexpected(r.error());
    p += bytes_per_item;
  }
  return DenseVector(std::move(data));
}

template <typename Item>
auto DenseVector<Item>::from_float_base64(std::string_view text) -> std::expected<DenseVector, core::error> {
  if constexpr (std::is_same_v<Item, Float32Item>) {
    // item encoding already is 4-byte float: adopt the payload as wire items
    auto raw = util::base64_decode(text);
    if (!raw) return std::unexpected(raw.error());
    return from_item_bytes(std::move(*raw));
  } else {
    auto values = decode_float_base64(text);
    if (!values) return std::unexpected(values.error());
    return from_float_list(*values);
  }
}

template <typename Item>
auto DenseVector<Item>::from_database_binary(std::span<const std::uint8_t> bytes)
    -> std::expected<DenseVector, core::error> {
  if (bytes.size() < header_size) {
    return std::unexpected(core::error{core::error_code::format_error,
                                       "expected 4-byte header; got " + std::to_string(bytes.size()) + " bytes",
                                       "vector.dense"});
  }
  const std::size_t dim = wire::load_be16(bytes.data());
  // bytes [2,4) are reserved and ignored
  const std::size_t body = bytes.size() - header_size;
  if (body != bytes_per_item * dim) {
    return std::unexpected(core::error{core::error_code::format_error,
                                       "expected size: " + std::to_string(bytes_per_item) + " * " +
                                           std::to_string(dim) + "; got " + std::to_string(body) + " bytes",
                                       "vector.dense"});
  }
  return DenseVector(std::vector<std::uint8_t>(bytes.begin() + header_size, bytes.end()));
}

template <typename Item>
auto DenseVector<Item>::to_float_list() const -> std::vector<double> {
  std::vector<double> out(size());
  for (std::size_t i = 0; i < out.size(); ++i) out[i] = Item::load(data_.data() + i * bytes_per_item);
  return out;
}

template <typename Item>
auto DenseVector<Item>::to_database_binary() const -> std::vector<std::uint8_t> {
  std::vector<std::uint8_t> out(header_size + data_.size());
  wire::store_be16(out.data(), static_cast<std::uint16_t>(size()));
  wire::store_be16(out.data() + 2, 0);
  std::copy(data_.begin(), data_.end(), out.begin() + header_size);
  return out;
}

template class DenseVector<Float32Item>;
template class DenseVector<Float16Item>;

template <typename Item>
static auto summary(const DenseVector<Item>& v) -> std::string {
  return std::string(class_name(Item::kind)) + "(dim=" + std::to_string(v.size()) + ")";
}

template <typename Item>
static auto full(const DenseVector<Item>& v) -> std::string {
  return std::string(class_name(Item::kind)) + "(" + util::to_hex(v.data()) + ")";
}

auto to_string(const Vector& v) -> std::string { return summary(v); }
auto to_string(const HalfVector& v) -> std::string { return summary(v); }
auto repr(const Vector& v) -> std::string { return full(v); }
auto repr(const HalfVector& v) -> std::string { return full(v); }

} // namespace pgvec
