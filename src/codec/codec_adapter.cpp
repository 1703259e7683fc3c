#include "pgvec/codec/codec_adapter.hpp"

#include <type_traits>
#include <utility>

#include "pgvec/core/log.hpp"

namespace pgvec::codec {

namespace {

auto type_error(std::string msg) -> core::error {
  return core::error{core::error_code::type_error, std::move(msg), "codec.adapter"};
}

// Collect the doubles of a list, rejecting the first element of any other type.
auto collect_floats(const FloatSequence& seq) -> std::expected<std::vector<double>, core::error> {
  std::vector<double> out;
  out.reserve(seq.size());
  for (std::size_t i = 0; i < seq.size(); ++i) {
    const auto* d = std::get_if<double>(&seq[i]);
    if (d == nullptr) {
      return std::unexpected(type_error("unsupported list item type: " + std::string(scalar_type_name(seq[i])) +
                                        " at position " + std::to_string(i)));
    }
    out.push_back(*d);
  }
  return out;
}

auto encode_impl(VectorKind target, const EncodeInput& value) -> std::expected<WireValue, core::error> {
  if (std::holds_alternative<Absent>(value)) {
    return WireValue{};
  }
  if (const auto* vec = std::get_if<AnyVector>(&value)) {
    if (kind_of(*vec) != target) {
      return std::unexpected(type_error("unsupported type: " + std::string(class_name(kind_of(*vec))) +
                                        " for column type " + std::string(type_name(target))));
    }
    return WireValue{to_database_binary(*vec)};
  }
  if (const auto* seq = std::get_if<FloatSequence>(&value)) {
    if (seq->empty()) {
      return WireValue{to_database_binary(empty_vector(target))};
    }
    auto floats = collect_floats(*seq);
    if (!floats) return std::unexpected(floats.error());
    auto vec = from_float_list(target, *floats);
    if (!vec) return std::unexpected(vec.error());
    return WireValue{to_database_binary(*vec)};
  }
  return std::unexpected(type_error("unsupported type: " + input_type_name(value)));
}

} // namespace

auto scalar_type_name(const ScalarValue& v) noexcept -> std::string_view {
  return std::visit(
      [](const auto& x) noexcept -> std::string_view {
        using T = std::decay_t<decltype(x)>;
        if constexpr (std::is_same_v<T, double>) return "float";
        else if constexpr (std::is_same_v<T, std::int64_t>) return "int";
        else if constexpr (std::is_same_v<T, bool>) return "bool";
        else return "str";
      },
      v);
}

auto input_type_name(const EncodeInput& v) -> std::string {
  return std::visit(
      [](const auto& x) -> std::string {
        using T = std::decay_t<decltype(x)>;
        if constexpr (std::is_same_v<T, Absent>) return "NoneType";
        else if constexpr (std::is_same_v<T, AnyVector>) return std::string(class_name(kind_of(x)));
        else if constexpr (std::is_same_v<T, FloatSequence>) return "list";
        else return x.type_name;
      },
      v);
}

auto encode_value(VectorKind target, const EncodeInput& value) -> std::expected<WireValue, core::error> {
  auto r = encode_impl(target, value);
  if (!r) core::debug_log_error("codec", r.error());
  return r;
}

auto decode_value(VectorKind target, WireView bytes, const SparseDecodeOptions& options)
    -> std::expected<std::optional<AnyVector>, core::error> {
  if (!bytes) return std::optional<AnyVector>{};
  auto vec = from_database_binary(target, *bytes, options);
  if (!vec) {
    core::debug_log_error("codec", vec.error());
    return std::unexpected(std::move(vec.error()));
  }
  return std::optional<AnyVector>{std::move(*vec)};
}

auto make_type_codec(VectorKind kind, const CodecConfig& cfg) -> TypeCodec {
  TypeCodec c;
  c.kind = kind;
  c.type_name = std::string(type_name(kind));
  c.schema = cfg.schema;
  c.encoder = [kind](const EncodeInput& v) { return encode_value(kind, v); };
  c.decoder = [kind, options = sparse_decode_options(cfg)](WireView b) { return decode_value(kind, b, options); };
  core::debug_log("codec", "codec for " + c.schema + "." + c.type_name + " (" + c.format + ")");
  return c;
}

auto type_codecs(const CodecConfig& cfg) -> std::vector<TypeCodec> {
  std::vector<TypeCodec> out;
  out.reserve(3);
  for (auto kind : {VectorKind::vector, VectorKind::halfvec, VectorKind::sparsevec}) {
    out.push_back(make_type_codec(kind, cfg));
  }
  return out;
}

} // namespace pgvec::codec
