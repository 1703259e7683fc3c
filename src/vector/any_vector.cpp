#include "pgvec/vector/any_vector.hpp"

#include <type_traits>

namespace pgvec {

namespace {

// Lift expected<T> into expected<AnyVector>.
template <typename T>
auto widen(std::expected<T, core::error>&& r) -> std::expected<AnyVector, core::error> {
  if (!r) return std::unexpected(std::move(r.error()));
  return AnyVector{std::move(*r)};
}

} // namespace

auto kind_of(const AnyVector& v) noexcept -> VectorKind {
  return std::visit([](const auto& x) noexcept { return std::decay_t<decltype(x)>::kind; }, v);
}

auto size(const AnyVector& v) noexcept -> std::size_t {
  return std::visit([](const auto& x) noexcept { return x.size(); }, v);
}

auto to_float_list(const AnyVector& v) -> std::vector<double> {
  return std::visit([](const auto& x) { return x.to_float_list(); }, v);
}

auto to_database_binary(const AnyVector& v) -> std::vector<std::uint8_t> {
  return std::visit([](const auto& x) { return x.to_database_binary(); }, v);
}

auto to_string(const AnyVector& v) -> std::string {
  return std::visit([](const auto& x) { return to_string(x); }, v);
}

auto repr(const AnyVector& v) -> std::string {
  return std::visit([](const auto& x) { return repr(x); }, v);
}

auto empty_vector(VectorKind kind) -> AnyVector {
  switch (kind) {
    case VectorKind::vector: return Vector{};
    case VectorKind::halfvec: return HalfVector{};
    case VectorKind::sparsevec: return SparseVector{};
  }
  return Vector{};
}

auto from_float_list(VectorKind kind, std::span<const double> values) -> std::expected<AnyVector, core::error> {
  switch (kind) {
    case VectorKind::vector: return widen(Vector::from_float_list(values));
    case VectorKind::halfvec: return widen(HalfVector::from_float_list(values));
    case VectorKind::sparsevec: return widen(SparseVector::from_float_list(values));
  }
  return std::unexpected(core::error{core::error_code::unsupported, "unknown vector kind", "vector"});
}

auto from_float_base64(VectorKind kind, std::string_view text) -> std::expected<AnyVector, core::error> {
  switch (kind) {
    case VectorKind::vector: return widen(Vector::from_float_base64(text));
    case VectorKind::halfvec: return widen(HalfVector::from_float_base64(text));
    case VectorKind::sparsevec: return widen(SparseVector::from_float_base64(text));
  }
  return std::unexpected(core::error{core::error_code::unsupported, "unknown vector kind", "vector"});
}

auto from_database_binary(VectorKind kind, std::span<const std::uint8_t> bytes, const SparseDecodeOptions& options)
    -> std::expected<AnyVector, core::error> {
  switch (kind) {
    case VectorKind::vector: return widen(Vector::from_database_binary(bytes));
    case VectorKind::halfvec: return widen(HalfVector::from_database_binary(bytes));
    case VectorKind::sparsevec: return widen(SparseVector::from_database_binary(bytes, options));
  }
  return std::unexpected(core::error{core::error_code::unsupported, "unknown vector kind", "vector"});
}

} // namespace pgvec
