#include "pgvec/config.hpp"

#include <algorithm>
#include <cctype>
#include <utility>

#include "pgvec/core/platform_utils.hpp"

namespace pgvec {

auto sparse_decode_options(const CodecConfig& cfg) noexcept -> SparseDecodeOptions {
  SparseDecodeOptions o;
  o.require_ascending_indices = cfg.sparse_require_ascending;
  return o;
}

auto is_sql_identifier(std::string_view name) noexcept -> bool {
  if (name.empty() || name.size() > 63) return false;
  const auto head = static_cast<unsigned char>(name.front());
  if (!(std::isalpha(head) || head == '_')) return false;
  return std::all_of(name.begin(), name.end(), [](char c) {
    const auto u = static_cast<unsigned char>(c);
    return std::isalnum(u) || u == '_';
  });
}

static auto parse_bool(std::string_view v) -> std::expected<bool, core::error> {
  if (v == "1" || v == "true" || v == "TRUE" || v == "on") return true;
  if (v == "0" || v == "false" || v == "FALSE" || v == "off") return false;
  return std::unexpected(core::error{core::error_code::config_invalid,
                                     "expected boolean, got '" + std::string(v) + "'", "config"});
}

auto load_codec_config_from_env() -> std::expected<CodecConfig, core::error> {
  CodecConfig cfg;
  if (auto schema = core::read_env("PGVEC_SCHEMA")) {
    if (!is_sql_identifier(*schema)) {
      return std::unexpected(core::error{core::error_code::config_invalid,
                                         "PGVEC_SCHEMA is not a valid identifier: '" + *schema + "'", "config"});
    }
    cfg.schema = std::move(*schema);
  }
  if (auto ascending = core::read_env("PGVEC_SPARSE_ASCENDING")) {
    auto b = parse_bool(*ascending);
    if (!b) {
      auto e = b.error();
      e.message = "PGVEC_SPARSE_ASCENDING: " + e.message;
      return std::unexpected(std::move(e));
    }
    cfg.sparse_require_ascending = *b;
  }
  return cfg;
}

} // namespace pgvec
