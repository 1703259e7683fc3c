#pragma once

/** \file sparse_vector.hpp
 *  \brief Sparse single-precision vectors (`sparsevec`).
 *
 * Wire format (big-endian):
 *   i32 dim | i32 nnz | i32 reserved(=0, ignored on read) | nnz x i32 index | nnz x f32 value
 *
 * Only non-zero positions are stored. The indices and values buffers are kept in wire
 * byte order and always describe the same number of entries; every index lies in [0, dim).
 * Index order and uniqueness are not required on decode unless requested through
 * SparseDecodeOptions; with duplicates, to_float_list() keeps the last value written.
 */

#include <cstddef>
#include <cstdint>
#include <expected>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "pgvec/error.hpp"
#include "pgvec/vector/vector_kind.hpp"

namespace pgvec {

struct SparseDecodeOptions {
  bool require_ascending_indices{false}; // reject unordered or duplicate indices
};

class SparseVector {
public:
  static constexpr VectorKind kind = VectorKind::sparsevec;
  static constexpr std::size_t header_size = 12;
  static constexpr std::size_t max_dim = 1'000'000'000; // server-side sparsevec limit

  /** \brief Zero-dimension vector with no entries. */
  SparseVector() = default;

  /** \brief Assemble from a dimensionality and big-endian index/value buffers.
   *  \return format_error if either buffer is not a whole number of 4-byte entries, the two
   *          buffers hold different entry counts, dim is negative or above max_dim, or an index is outside
   *          [0, dim) (or out of order when options require ascending indices).
   */
  static auto from_parts(std::int32_t dim, std::span<const std::uint8_t> indices,
                         std::span<const std::uint8_t> values, const SparseDecodeOptions& options = {})
      -> std::expected<SparseVector, core::error>;

  /** \brief Keep the positions whose value is not exactly zero; dim = values.size(). */
  static auto from_float_list(std::span<const double> values) -> std::expected<SparseVector, core::error>;

  /** \brief Import a base64 payload of host-order float32 values through from_float_list. */
  static auto from_float_base64(std::string_view text) -> std::expected<SparseVector, core::error>;

  /** \brief Parse the wire representation; format_error unless len == 12 + 8 * nnz. */
  static auto from_database_binary(std::span<const std::uint8_t> bytes, const SparseDecodeOptions& options = {})
      -> std::expected<SparseVector, core::error>;

  /** \brief Declared dimensionality (zeros are elided, so not derivable from the buffers). */
  auto size() const noexcept -> std::size_t { return static_cast<std::size_t>(dim_); }
  /** \brief Number of stored entries. */
  auto nnz() const noexcept -> std::size_t { return indices_.size() / 4; }

  auto indices() const noexcept -> std::span<const std::uint8_t> { return indices_; }
  auto values() const noexcept -> std::span<const std::uint8_t> { return values_; }

  auto index_at(std::size_t i) const noexcept -> std::int32_t;
  auto value_at(std::size_t i) const noexcept -> float;

  /** \brief Dense expansion of length size(), zero everywhere except the stored entries. */
  auto to_float_list() const -> std::vector<double>;

  auto to_database_binary() const -> std::vector<std::uint8_t>;

  friend bool operator==(const SparseVector&, const SparseVector&) = default;

private:
  SparseVector(std::int32_t dim, std::vector<std::uint8_t> indices, std::vector<std::uint8_t> values)
      : dim_(dim), indices_(std::move(indices)), values_(std::move(values)) {}

  std::int32_t dim_{0};
  std::vector<std::uint8_t> indices_;
  std::vector<std::uint8_t> values_;
};

/** \brief Compact summary, e.g. "SparseVector(dim=1536, nnz=153)". */
auto to_string(const SparseVector& v) -> std::string;

/** \brief Full representation with the index and value buffers in hex. */
auto repr(const SparseVector& v) -> std::string;

} // namespace pgvec
