#pragma once

/** \file codec_adapter.hpp
 *  \brief Encode/decode hooks handed to a database client's type-codec registration.
 *
 * A client that supports binary custom-type codecs calls, per column value:
 *   encoder: EncodeInput -> bytes or NULL
 *   decoder: bytes or NULL -> vector or NULL
 * The caller (or a thin shim next to the registration call) translates its dynamic values
 * into EncodeInput, so this layer never guesses at runtime types.
 *
 * Thread-safety: every function here is a stateless transform.
 * Errors: type_error for inputs of the wrong shape, otherwise whatever the codec reports.
 */

#include <cstdint>
#include <expected>
#include <functional>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "pgvec/config.hpp"
#include "pgvec/error.hpp"
#include "pgvec/vector/any_vector.hpp"
#include "pgvec/vector/vector_kind.hpp"

namespace pgvec::codec {

/** \brief SQL NULL on the encode side. */
struct Absent {
  friend bool operator==(const Absent&, const Absent&) = default;
};

/** \brief One element of a caller-supplied list, tagged with its dynamic type. */
using ScalarValue = std::variant<double, std::int64_t, bool, std::string>;

/** \brief A list offered for encoding; every element must be a double. */
using FloatSequence = std::vector<ScalarValue>;

/** \brief Any other caller value, carried only by its type name for error reporting. */
struct OpaqueValue {
  std::string type_name;
};

using EncodeInput = std::variant<Absent, AnyVector, FloatSequence, OpaqueValue>;

/** \brief Wire bytes, or std::nullopt for SQL NULL. */
using WireValue = std::optional<std::vector<std::uint8_t>>;

/** \brief Borrowed wire bytes, or std::nullopt for SQL NULL. */
using WireView = std::optional<std::span<const std::uint8_t>>;

/** \brief Dynamic type name of a list element: "float", "int", "bool" or "str". */
auto scalar_type_name(const ScalarValue& v) noexcept -> std::string_view;

/** \brief Dynamic type name of an encode input, e.g. "NoneType", "SparseVector", "list". */
auto input_type_name(const EncodeInput& v) -> std::string;

/** \brief Encode \p value as the wire form of \p target.
 *
 * - Absent passes through as NULL.
 * - A vector of kind \p target is encoded as is; a vector of another kind is a type_error.
 * - An empty FloatSequence encodes the zero-dimension vector.
 * - A non-empty FloatSequence is converted with from_float_list; a non-double element is a
 *   type_error naming its type and position.
 * - An OpaqueValue is a type_error naming its type.
 */
auto encode_value(VectorKind target, const EncodeInput& value) -> std::expected<WireValue, core::error>;

/** \brief Decode \p bytes as \p target; NULL passes through unchanged. */
auto decode_value(VectorKind target, WireView bytes, const SparseDecodeOptions& options = {})
    -> std::expected<std::optional<AnyVector>, core::error>;

using EncodeFn = std::function<std::expected<WireValue, core::error>(const EncodeInput&)>;
using DecodeFn = std::function<std::expected<std::optional<AnyVector>, core::error>(WireView)>;

/** \brief Everything a client needs to register one extension type. */
struct TypeCodec {
  VectorKind kind{VectorKind::vector};
  std::string type_name;
  std::string schema;
  std::string format{"binary"};
  EncodeFn encoder;
  DecodeFn decoder;
};

/** \brief Codec for one kind, bound to the schema and decode options of \p cfg. */
auto make_type_codec(VectorKind kind, const CodecConfig& cfg = {}) -> TypeCodec;

/** \brief Codecs for `vector`, `halfvec` and `sparsevec`, in that order. */
auto type_codecs(const CodecConfig& cfg = {}) -> std::vector<TypeCodec>;

} // namespace pgvec::codec
