#pragma once

/** \file any_vector.hpp
 *  \brief A value of any vector kind, dispatched with std::visit.
 */

#include <cstdint>
#include <expected>
#include <span>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "pgvec/error.hpp"
#include "pgvec/vector/dense_vector.hpp"
#include "pgvec/vector/sparse_vector.hpp"
#include "pgvec/vector/vector_kind.hpp"

namespace pgvec {

using AnyVector = std::variant<Vector, HalfVector, SparseVector>;

auto kind_of(const AnyVector& v) noexcept -> VectorKind;
auto size(const AnyVector& v) noexcept -> std::size_t;
auto to_float_list(const AnyVector& v) -> std::vector<double>;
auto to_database_binary(const AnyVector& v) -> std::vector<std::uint8_t>;
auto to_string(const AnyVector& v) -> std::string;
auto repr(const AnyVector& v) -> std::string;

/** \brief Zero-dimension vector of the given kind. */
auto empty_vector(VectorKind kind) -> AnyVector;

auto from_float_list(VectorKind kind, std::span<const double> values) -> std::expected<AnyVector, core::error>;
auto from_float_base64(VectorKind kind, std::string_view text) -> std::expected<AnyVector, core::error>;
auto from_database_binary(VectorKind kind, std::span<const std::uint8_t> bytes,
                          const SparseDecodeOptions& options = {}) -> std::expected<AnyVector, core::error>;

} // namespace pgvec
