#include "pgvec/vector/sparse_vector.hpp"

#include <algorithm>

#include "pgvec/util/hex.hpp"
#include "pgvec/vector/float_base64.hpp"
#include "pgvec/wire/byte_order.hpp"

namespace pgvec {

static auto format_error(std::string msg) -> std::unexpected<core::error> {
  return std::unexpected(core::error{core::error_code::format_error, std::move(msg), "vector.sparse"});
}

auto SparseVector::from_parts(std::int32_t dim, std::span<const std::uint8_t> indices,
                              std::span<const std::uint8_t> values, const SparseDecodeOptions& options)
    -> std::expected<SparseVector, core::error> {
  if (indices.size() % 4 != 0 || values.size() % 4 != 0) {
    return format_error("index and value buffers must hold 4-byte entries");
  }
  if (indices.size() / 4 != values.size() / 4) {
    return format_error("indices and values length mismatch: " + std::to_string(indices.size() / 4) +
                        " != " + std::to_string(values.size() / 4));
  }
  if (dim < 0) {
    return format_error("negative dimension " + std::to_string(dim));
  }
  if (static_cast<std::size_t>(dim) > max_dim) {
    return format_error("dimension " + std::to_string(dim) + " exceeds " + std::to_string(max_dim));
  }
  const std::size_t n = indices.size() / 4;
  std::int32_t prev = -1;
  for (std::size_t i = 0; i < n; ++i) {
    const std::int32_t idx = wire::load_be_i32(indices.data() + i * 4);
    if (idx < 0 || idx >= dim) {
      return format_error("index " + std::to_string(idx) + " out of range for dimension " + std::to_string(dim));
    }
    if (options.require_ascending_indices && idx <= prev) {
      return format_error("indices not strictly increasing at entry " + std::to_string(i));
    }
    prev = idx;
  }
  return SparseVector(dim, std::vector<std::uint8_t>(indices.begin(), indices.end()),
                      std::vector<std::uint8_t>(values.begin(), values.end()));
}

auto SparseVector::from_float_list(std::span<const double> values) -> std::expected<SparseVector, core::error> {
  if (values.size() > max_dim) {
    return std::unexpected(core::error{core::error_code::out_of_range,
                                       "dimension " + std::to_string(values.size()) + " exceeds " +
                                           std::to_string(max_dim),
                                       "vector.sparse"});
  }
  std::vector<std::int32_t> idx;
  std::vector<float> val;
  for (std::size_t i = 0; i < values.size(); ++i) {
    if (values[i] == 0.0) continue;
    auto f = wire::narrow_to_f32(values[i]);
    if (!f) return std::unexpected(f.error());
    if (*f == 0.0f) continue; // underflowed to zero
    idx.push_back(static_cast<std::int32_t>(i));
    val.push_back(*f);
  }
  return SparseVector(static_cast<std::int32_t>(values.size()), wire::pack_be_i32(idx), wire::pack_be_f32(val));
}

auto SparseVector::from_float_base64(std::string_view text) -> std::expected<SparseVector, core::error> {
  auto values = decode_float_base64(text);
  if (!values) return std::unexpected(values.error());
  return from_float_list(*values);
}

auto SparseVector::from_database_binary(std::span<const std::uint8_t> bytes, const SparseDecodeOptions& options)
    -> std::expected<SparseVector, core::error> {
  if (bytes.size() < header_size) {
    return format_error("expected 12-byte header; got " + std::to_string(bytes.size()) + " bytes");
  }
  const std::int32_t dim = wire::load_be_i32(bytes.data());
  const std::int32_t nnz = wire::load_be_i32(bytes.data() + 4);
  // bytes [8,12) are reserved and ignored
  if (nnz < 0) {
    return format_error("negative entry count " + std::to_string(nnz));
  }
  const std::uint64_t body = bytes.size() - header_size;
  const std::uint64_t want = 8u * static_cast<std::uint64_t>(nnz);
  if (body != want) {
    return format_error("expected size: 8 * " + std::to_string(nnz) + "; got " + std::to_string(body) + " bytes");
  }
  const std::size_t split = header_size + 4u * static_cast<std::size_t>(nnz);
  return from_parts(dim, bytes.subspan(header_size, split - header_size), bytes.subspan(split), options);
}

auto SparseVector::index_at(std::size_t i) const noexcept -> std::int32_t {
  return wire::load_be_i32(indices_.data() + i * 4);
}

auto SparseVector::value_at(std::size_t i) const noexcept -> float {
  return wire::load_be_f32(values_.data() + i * 4);
}

auto SparseVector::to_float_list() const -> std::vector<double> {
  std::vector<double> out(size(), 0.0);
  for (std::size_t i = 0; i < nnz(); ++i) {
    out[static_cast<std::size_t>(index_at(i))] = static_cast<double>(value_at(i));
  }
  return out;
}

auto SparseVector::to_database_binary() const -> std::vector<std::uint8_t> {
  std::vector<std::uint8_t> out(header_size + indices_.size() + values_.size());
  wire::store_be_i32(out.data(), dim_);
  wire::store_be_i32(out.data() + 4, static_cast<std::int32_t>(nnz()));
  wire::store_be_i32(out.data() + 8, 0);
  auto it = std::copy(indices_.begin(), indices_.end(), out.begin() + header_size);
  std::copy(values_.begin(), values_.end(), it);
  return out;
}

auto to_string(const SparseVector& v) -> std::string {
  return "SparseVector(dim=" + std::to_string(v.size()) + ", nnz=" + std::to_string(v.nnz()) + ")";
}

auto repr(const SparseVector& v) -> std::string {
  return "SparseVector(dim=" + std::to_string(v.size()) + ", indices=" + util::to_hex(v.indices()) +
         ", values=" + util::to_hex(v.values()) + ")";
}

} // namespace pgvec
