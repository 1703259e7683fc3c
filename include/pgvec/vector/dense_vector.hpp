#pragma once

/** \file dense_vector.hpp
 *  \brief Dense vectors (`vector` and `halfvec`) sharing one wire layout.
 *
 * Wire format (big-endian):
 *   u16 dim | u16 reserved(=0, ignored on read) | dim x item
 * where item is float32 for `vector` and float16 for `halfvec`.
 *
 * A DenseVector owns the item bytes exactly as they appear on the wire, so encode is a
 * header prepend and decode is a length check plus copy. Values are immutable once built.
 * Thread-safety: const member functions are safe to call concurrently.
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

/** \brief Item traits for single-precision dense vectors. */
struct Float32Item {
  static constexpr std::size_t bytes_per_item = 4;
  static constexpr VectorKind kind = VectorKind::vector;

  static auto store(std::uint8_t* p, double v) -> std::expected<void, core::error>;
  static auto load(const std::uint8_t* p) noexcept -> double;
};

/** \brief Item traits for half-precision dense vectors. */
struct Float16Item {
  static constexpr std::size_t bytes_per_item = 2;
  static constexpr VectorKind kind = VectorKind::halfvec;

  static auto store(std::uint8_t* p, double v) -> std::expected<void, core::error>;
  static auto load(const std::uint8_t* p) noexcept -> double;
};

template <typename Item>
class DenseVector {
public:
  static constexpr std::size_t bytes_per_item = Item::bytes_per_item;
  static constexpr VectorKind kind = Item::kind;
  static constexpr std::size_t header_size = 4;
  static constexpr std::size_t max_dim = 0xFFFF; // u16 header field

  /** \brief Zero-dimension vector with an empty buffer. */
  DenseVector() = default;

  /** \brief Adopt big-endian item bytes.
   *  \return format_error if the size is not a multiple of the item width,
   *          out_of_range if the dimensionality does not fit the header.
   */
  static auto from_item_bytes(std::vector<std::uint8_t> data) -> std::expected<DenseVector, core::error>;

  /** \brief Narrow each value to the item width, preserving order.
   *  \return out_of_range when a finite value overflows the item width or there are
   *          more than max_dim values.
   */
  static auto from_float_list(std::span<const double> values) -> std::expected<DenseVector, core::error>;

  /** \brief Import a base64 payload of raw float32 values (see float_base64.hpp).
   *
   * For `vector` the decoded bytes are taken verbatim as wire items, i.e. big-endian float32.
   * For `halfvec` they are read as host-order float32 and narrowed through from_float_list.
   */
  static auto from_float_base64(std::string_view text) -> std::expected<DenseVector, core::error>;

  /** \brief Parse the wire representation; format_error unless len == 4 + bytes_per_item * dim. */
  static auto from_database_binary(std::span<const std::uint8_t> bytes) -> std::expected<DenseVector, core::error>;

  auto size() const noexcept -> std::size_t { return data_.size() / bytes_per_item; }
  auto data() const noexcept -> std::span<const std::uint8_t> { return data_; }

  /** \brief Items widened to double, in stored order. */
  auto to_float_list() const -> std::vector<double>;

  auto to_database_binary() const -> std::vector<std::uint8_t>;

  friend bool operator==(const DenseVector&, const DenseVector&) = default;

private:
  explicit DenseVector(std::vector<std::uint8_t> data) : data_(std::move(data)) {}

  std::vector<std::uint8_t> data_;
};

using Vector = DenseVector<Float32Item>;
using HalfVector = DenseVector<Float16Item>;

extern template class DenseVector<Float32Item>;
extern template class DenseVector<Float16Item>;

/** \brief Compact summary, e.g. "Vector(dim=1536)". */
auto to_string(const Vector& v) -> std::string;
auto to_string(const HalfVector& v) -> std::string;

/** \brief Full representation with every stored byte in hex, e.g. "Vector(3f800000c0200000)". */
auto repr(const Vector& v) -> std::string;
auto repr(const HalfVector& v) -> std::string;

} // namespace pgvec
