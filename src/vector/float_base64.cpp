#include "pgvec/vector/float_base64.hpp"

#include "pgvec/util/base64.hpp"
#include "pgvec/wire/byte_order.hpp"

namespace pgvec {

auto decode_float_base64(std::string_view text) -> std::expected<std::vector<double>, core::error> {
  auto raw = util::base64_decode(text);
  if (!raw) return std::unexpected(raw.error());
  auto floats = wire::unpack_native_f32(*raw);
  if (!floats) return std::unexpected(floats.error());
  return std::vector<double>(floats->begin(), floats->end());
}

} // namespace pgvec
