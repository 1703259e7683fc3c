#pragma once

/** \file vector_kind.hpp
 *  \brief The closed set of vector kinds and their database-facing names.
 */

#include <cstdint>
#include <string_view>

namespace pgvec {

enum class VectorKind : std::uint8_t { vector, halfvec, sparsevec };

/** \brief Extension type name as declared in the database ("vector", "halfvec", "sparsevec"). */
constexpr std::string_view type_name(VectorKind k) noexcept {
  switch (k) {
    case VectorKind::vector: return "vector";
    case VectorKind::halfvec: return "halfvec";
    case VectorKind::sparsevec: return "sparsevec";
  }
  return "unknown";
}

/** \brief Operator class used to build a cosine-distance index over the kind. */
constexpr std::string_view cosine_ops(VectorKind k) noexcept {
  switch (k) {
    case VectorKind::vector: return "vector_cosine_ops";
    case VectorKind::halfvec: return "halfvec_cosine_ops";
    case VectorKind::sparsevec: return "sparsevec_cosine_ops";
  }
  return "unknown";
}

/** \brief C++ class name of the kind, used in display strings and type errors. */
constexpr std::string_view class_name(VectorKind k) noexcept {
  switch (k) {
    case VectorKind::vector: return "Vector";
    case VectorKind::halfvec: return "HalfVector";
    case VectorKind::sparsevec: return "SparseVector";
  }
  return "unknown";
}

} // namespace pgvec
